#pragma once
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <cstdint>
#include <string>

// Standard alphabet with '=' padding
inline std::string base64Encode(const uint8_t* data, size_t len) {
    using namespace boost::archive::iterators;
    using Encoder = base64_from_binary<transform_width<const uint8_t*, 6, 8>>;

    std::string out(Encoder(data), Encoder(data + len));
    out.append((3 - len % 3) % 3, '=');
    return out;
}

inline std::string base64Encode(const std::string& bytes) {
    return base64Encode(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}
