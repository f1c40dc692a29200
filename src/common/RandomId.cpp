#include "RandomId.hpp"

#include <mutex>
#include <random>

std::string GenerateRandomId(size_t length) {
    static const std::string letters = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    static std::mt19937_64 engine{std::random_device{}()};
    static std::mutex engineMutex;

    std::uniform_int_distribution<size_t> pick(0, letters.size() - 1);

    std::string id;
    id.reserve(length);

    std::lock_guard<std::mutex> lock(engineMutex);
    for (size_t i = 0; i < length; ++i) {
        id += letters[pick(engine)];
    }
    return id;
}
