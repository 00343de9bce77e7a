// NameCodec.cpp
#include "NameCodec.hpp"
#include <charconv>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

bool allDigits(const std::string& text, std::size_t from) {
    if (from >= text.size()) {
        return false;
    }
    for (std::size_t i = from; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }
    return true;
}

} // namespace

NameCodec::NameCodec(std::string prefix, int digits)
    : m_prefix(std::move(prefix)), m_digits(digits) {
    if (m_digits < 1) {
        throw std::invalid_argument("version digits must be >= 1, got " + std::to_string(digits));
    }
}

NameCodec::NameCodec(const Settings& settings)
    : NameCodec(settings.versionPrefix, settings.versionDigits) {}

std::string NameCodec::encode(VersionId version) const {
    if (version < 0) {
        throw std::invalid_argument("negative version: " + std::to_string(version));
    }
    std::ostringstream out;
    out << m_prefix << std::setw(m_digits) << std::setfill('0') << version;
    return out.str();
}

std::optional<std::size_t> NameCodec::suffixPosition(const std::string& name) const {
    // Самое левое вхождение prefix, за которым до конца строки идут только цифры
    std::size_t pos = name.find(m_prefix);
    while (pos != std::string::npos) {
        if (allDigits(name, pos + m_prefix.size())) {
            return pos;
        }
        pos = name.find(m_prefix, pos + 1);
    }
    return std::nullopt;
}

std::optional<VersionId> NameCodec::decode(const std::string& name) const {
    auto pos = suffixPosition(name);
    if (!pos) {
        return std::nullopt;
    }

    const char* first = name.data() + *pos + m_prefix.size();
    const char* last = name.data() + name.size();
    VersionId value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt; // не помещается в VersionId
    }
    return value;
}
