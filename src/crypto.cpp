#include "crypto.hpp"
#include <openssl/evp.h>
#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

md_ctx_ptr new_sha512_context() {
    md_ctx_ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha512(), nullptr) != 1)
        throw std::runtime_error("EVP_DigestInit_ex(sha512) failed");
    return ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, size_t size) {
    if (EVP_DigestUpdate(ctx, data, size) != 1)
        throw std::runtime_error("EVP_DigestUpdate failed");
}

std::vector<unsigned char> finish(EVP_MD_CTX* ctx) {
    std::vector<unsigned char> hash(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash.data(), &len) != 1)
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    hash.resize(len);
    return hash;
}

} // namespace

std::vector<unsigned char> sha512(const std::vector<unsigned char>& data) {
    auto ctx = new_sha512_context();
    update(ctx.get(), data.data(), data.size());
    return finish(ctx.get());
}

std::vector<unsigned char> sha512_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot open " + path + " for hashing");

    auto ctx = new_sha512_context();
    std::array<char, 64 * 1024> buf;
    while (in) {
        in.read(buf.data(), buf.size());
        if (in.gcount() > 0)
            update(ctx.get(), buf.data(), static_cast<size_t>(in.gcount()));
    }
    if (in.bad())
        throw std::runtime_error("read error while hashing " + path);
    return finish(ctx.get());
}

std::string hex_encode(const std::vector<unsigned char>& data) {
    std::ostringstream oss;
    for (auto byte : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    }
    return oss.str();
}
