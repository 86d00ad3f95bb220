#include "kioskagent/crypto.hpp"
#include "kioskagent/storage.hpp"

#include <openssl/bio.h>
#include <openssl/evp.h>

#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace kioskagent {
namespace crypto {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    std::ostringstream ss;
    for (unsigned int i = 0; i < len; i++) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

DigestContext new_sha256_context() {
    DigestContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

std::optional<std::string> finish(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1) {
        return std::nullopt;
    }
    return to_hex(hash, len);
}

}  // namespace

// ==================== SHA-256 ====================

std::string sha256_hex(const std::string& input) {
    auto ctx = new_sha256_context();
    if (!ctx) {
        return "";
    }
    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        return "";
    }
    return finish(ctx.get()).value_or("");
}

std::optional<std::string> sha256_file_hex(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return std::nullopt;
    }

    char buffer[64 * 1024];
    while (file) {
        file.read(buffer, sizeof(buffer));
        std::streamsize count = file.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(count)) != 1) {
            return std::nullopt;
        }
    }
    if (file.bad()) {
        return std::nullopt;
    }
    return finish(ctx.get());
}

// ==================== Base64 Decoding ====================

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::string padded;
    padded.reserve(encoded.size() + 3);
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            padded += c;
        }
    }
    if (padded.empty()) {
        return {};
    }

    // Add padding if necessary
    while (padded.size() % 4 != 0) {
        padded += '=';
    }

    // Create BIO chain for base64 decoding
    std::unique_ptr<BIO, decltype(&BIO_free_all)> b64(BIO_new(BIO_f_base64()), BIO_free_all);
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    std::unique_ptr<BIO, decltype(&BIO_free)> bmem(
        BIO_new_mem_buf(padded.data(), static_cast<int>(padded.size())), BIO_free);
    BIO_push(b64.get(), bmem.release());

    // Decoding shrinks by ~3/4
    std::vector<uint8_t> result(padded.size() * 3 / 4 + 1);

    int decoded_len = BIO_read(b64.get(), result.data(), static_cast<int>(result.size()));
    if (decoded_len > 0) {
        result.resize(static_cast<size_t>(decoded_len));
    } else {
        result.clear();
    }

    return result;
}

Result<void> write_qr_image(const ClaimTicket& ticket, const std::filesystem::path& destination) {
    if (ticket.qr_code_image.empty()) {
        return Result<void>::error(ErrorCode::MissingParameter, "Claim carries no QR image");
    }

    auto bytes = base64_decode(ticket.qr_code_image);
    if (bytes.empty()) {
        return Result<void>::error(ErrorCode::ParseError, "QR image is not valid base64");
    }

    std::string content(bytes.begin(), bytes.end());
    if (!files::write_file_atomic(destination, content)) {
        return Result<void>::error(ErrorCode::FileError, "Cannot write " + destination.string());
    }
    return Result<void>::ok();
}

}  // namespace crypto
}  // namespace kioskagent
