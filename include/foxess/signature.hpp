#pragma once
#include <cstdint>
#include <string>

namespace foxess {

// Разделитель подписи: буквально четыре символа '\', 'r', '\', 'n',
// а не управляющие байты CR/LF.
inline constexpr const char *kSignatureSeparator = "\\r\\n";

// md5(path + "\r\n" + token + "\r\n" + timestamp) в 32 hex-символах
// нижнего регистра. Чистая функция.
std::string sign(const std::string &path, const std::string &token,
                 std::int64_t timestamp_millis);

std::string md5_hex(const std::string &data);

} // namespace foxess
