#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "ProjectInfo.hpp"
#include "Settings.hpp"

// Кодирование номера версии в имя папки/файла: prefix + номер с ведущими нулями
class NameCodec {
public:
    NameCodec(std::string prefix, int digits);
    explicit NameCodec(const Settings& settings);

    std::string encode(VersionId version) const;
    std::optional<VersionId> decode(const std::string& name) const;

    // Позиция, с которой начинается суффикс версии (prefix + цифры до конца строки)
    std::optional<std::size_t> suffixPosition(const std::string& name) const;

    const std::string& prefix() const { return m_prefix; }
    int digits() const { return m_digits; }

private:
    std::string m_prefix;
    int m_digits;
};
