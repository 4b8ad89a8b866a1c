#include "tablepod/core/util/SecureRandom.h"

namespace tablepod::core::util {

int SecureRandom::UniformInt(int upper_exclusive) {
    if (upper_exclusive <= 1) {
        return 0;
    }
    std::uniform_int_distribution<int> distribution(0, upper_exclusive - 1);
    std::lock_guard<std::mutex> lock(mutex_);
    return distribution(device_);
}

double SecureRandom::UniformUnit() {
    std::uniform_real_distribution<double> distribution(0.0, 1.0);
    std::lock_guard<std::mutex> lock(mutex_);
    return distribution(device_);
}

std::string SecureRandom::Token(std::size_t length, const std::string& alphabet) {
    std::string token;
    if (alphabet.empty()) {
        return token;
    }
    token.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        const int index = UniformInt(static_cast<int>(alphabet.size()));
        token.push_back(alphabet[static_cast<std::size_t>(index)]);
    }
    return token;
}

}  // namespace tablepod::core::util
