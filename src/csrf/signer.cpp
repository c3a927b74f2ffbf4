#include "coroform/csrf/signer.hpp"

#include <array>
#include <chrono>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <zlib.h>

namespace coroform {

std::string_view signature_error_name(SignatureError e) noexcept {
    switch (e) {
        case SignatureError::Invalid: return "invalid";
        case SignatureError::Expired: return "expired";
        default: return "unknown";
    }
}

int64_t system_clock_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

namespace signing {

// ============================================================================
// Base64 (URL-safe, unpadded)
// ============================================================================

std::string base64_encode(std::string_view data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(len));

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::optional<std::string> base64_decode(std::string_view data) {
    while (!data.empty() && data.back() == '=') {
        data.remove_suffix(1);
    }
    if (data.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string standard;
    standard.reserve(data.size() + 3);
    for (char c : data) {
        if (c == '-') {
            standard += '+';
        } else if (c == '_') {
            standard += '/';
        } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            standard += c;
        } else {
            return std::nullopt;
        }
    }

    size_t padding = (4 - standard.size() % 4) % 4;
    standard.append(padding, '=');
    if (standard.empty()) {
        return std::string{};
    }

    std::string out(3 * standard.size() / 4, '\0');
    int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              reinterpret_cast<const unsigned char*>(standard.data()),
                              static_cast<int>(standard.size()));
    if (len < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts the bytes encoded by padding as zeros
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

std::string hex_encode(std::string_view data) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (unsigned char b : data) {
        out += hex[b >> 4];
        out += hex[b & 0x0F];
    }
    return out;
}

std::string derive_key(std::string_view secret, std::string_view salt) {
    std::string material;
    material.reserve(salt.size() + 6 + secret.size());
    material.append(salt);
    material.append("signer");
    material.append(secret);

    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    SHA1(reinterpret_cast<const unsigned char*>(material.data()), material.size(), digest.data());
    return std::string(reinterpret_cast<const char*>(digest.data()), digest.size());
}

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace signing

namespace {

// ============================================================================
// Timestamp and payload codecs
// ============================================================================

std::string int_to_bytes(int64_t value) {
    std::string out;
    auto v = static_cast<uint64_t>(value);
    for (int shift = 56; shift >= 0; shift -= 8) {
        auto byte = static_cast<char>((v >> shift) & 0xFF);
        if (out.empty() && byte == 0) continue;
        out += byte;
    }
    return out;
}

std::optional<int64_t> bytes_to_int(std::string_view bytes) {
    if (bytes.size() > 8) {
        return std::nullopt;
    }
    uint64_t v = 0;
    for (unsigned char b : bytes) {
        v = (v << 8) | b;
    }
    return static_cast<int64_t>(v);
}

std::optional<std::string> zlib_compress(std::string_view data) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (deflateInit(&stream, Z_DEFAULT_COMPRESSION) != Z_OK) {
        return std::nullopt;
    }

    std::string out;
    out.resize(deflateBound(&stream, static_cast<uLong>(data.size())));

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&stream, Z_FINISH);
    deflateEnd(&stream);
    if (ret != Z_STREAM_END) {
        return std::nullopt;
    }

    out.resize(stream.total_out);
    return out;
}

std::optional<std::string> zlib_decompress(std::string_view data) {
    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    if (inflateInit(&stream) != Z_OK) {
        return std::nullopt;
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string out;
    std::array<char, 4096> buffer{};
    int ret = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            return std::nullopt;
        }
        out.append(buffer.data(), buffer.size() - stream.avail_out);
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return out;
}

} // anonymous namespace

// ============================================================================
// TimestampSigner
// ============================================================================

TimestampSigner::TimestampSigner(const Secret& secret, std::string_view salt, Clock clock)
    : key_(signing::derive_key(secret.str(), salt))
    , clock_(clock ? std::move(clock) : Clock(system_clock_seconds))
{}

int64_t TimestampSigner::now() const {
    return clock_();
}

std::string TimestampSigner::signature(std::string_view value) const {
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
    unsigned int mac_len = 0;

    if (!HMAC(EVP_sha1(), key_.data(), static_cast<int>(key_.size()),
              reinterpret_cast<const unsigned char*>(value.data()), value.size(),
              mac.data(), &mac_len)) {
        throw std::runtime_error("HMAC-SHA1 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(mac.data()), mac_len);
}

std::string TimestampSigner::sign(std::string_view value) const {
    std::string signed_value(value);
    signed_value += '.';
    signed_value += signing::base64_encode(int_to_bytes(now()));

    auto sig = signing::base64_encode(signature(signed_value));
    signed_value += '.';
    signed_value += sig;
    return signed_value;
}

expected<std::string, SignatureError> TimestampSigner::unsign(std::string_view signed_value,
                                                              std::optional<int64_t> max_age) const {
    auto sig_sep = signed_value.rfind('.');
    if (sig_sep == std::string_view::npos) {
        return unexpected(SignatureError::Invalid);
    }

    auto value_and_ts = signed_value.substr(0, sig_sep);
    auto sig = signing::base64_decode(signed_value.substr(sig_sep + 1));
    if (!sig || !signing::constant_time_equals(*sig, signature(value_and_ts))) {
        return unexpected(SignatureError::Invalid);
    }

    auto ts_sep = value_and_ts.rfind('.');
    if (ts_sep == std::string_view::npos) {
        return unexpected(SignatureError::Invalid);
    }

    auto ts_bytes = signing::base64_decode(value_and_ts.substr(ts_sep + 1));
    if (!ts_bytes) {
        return unexpected(SignatureError::Invalid);
    }
    auto timestamp = bytes_to_int(*ts_bytes);
    if (!timestamp) {
        return unexpected(SignatureError::Invalid);
    }

    if (max_age) {
        int64_t age = now() - *timestamp;
        if (age > *max_age || age < 0) {
            return unexpected(SignatureError::Expired);
        }
    }

    return std::string(value_and_ts.substr(0, ts_sep));
}

// ============================================================================
// UrlSafeTimedSerializer
// ============================================================================

std::string UrlSafeTimedSerializer::dumps(std::string_view value) const {
    // Compact and ASCII-only, as Python's json.dumps writes it
    std::string json = nlohmann::json(std::string(value)).dump(-1, ' ', true);

    std::string payload;
    auto compressed = zlib_compress(json);
    if (compressed && compressed->size() < json.size() - 1) {
        payload = "." + signing::base64_encode(*compressed);
    } else {
        payload = signing::base64_encode(json);
    }
    return signer_.sign(payload);
}

expected<std::string, SignatureError> UrlSafeTimedSerializer::loads(std::string_view token,
                                                                    std::optional<int64_t> max_age) const {
    auto payload = signer_.unsign(token, max_age);
    if (!payload) {
        return unexpected(payload.error());
    }

    std::string_view encoded = *payload;
    bool compressed = false;
    if (!encoded.empty() && encoded.front() == '.') {
        encoded.remove_prefix(1);
        compressed = true;
    }

    auto json = signing::base64_decode(encoded);
    if (!json) {
        return unexpected(SignatureError::Invalid);
    }
    if (compressed) {
        json = zlib_decompress(*json);
        if (!json) {
            return unexpected(SignatureError::Invalid);
        }
    }

    auto doc = nlohmann::json::parse(*json, nullptr, false);
    if (doc.is_discarded() || !doc.is_string()) {
        return unexpected(SignatureError::Invalid);
    }
    return doc.get<std::string>();
}

} // namespace coroform
