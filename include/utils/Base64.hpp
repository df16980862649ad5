#pragma once

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <string>

namespace nimbasms::utils {

/**
 * @brief Base64 (RFC 4648, с паддингом) для заголовка Basic-аутентификации
 */
inline std::string base64Encode(const std::string& input) {
    using namespace boost::archive::iterators;
    using Base64Iterator = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

    std::string encoded(Base64Iterator(input.begin()), Base64Iterator(input.end()));
    encoded.append((3 - input.size() % 3) % 3, '=');
    return encoded;
}

} // namespace nimbasms::utils
