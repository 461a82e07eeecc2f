#include "load/assets.hpp"

#include "compiler/context.hpp"
#include "plugin/plugin.hpp"

#include <filesystem>
#include <map>
#include <stdexcept>

#include <openssl/evp.h>

namespace loom::load {

auto mime_type(std::string_view ext) -> const char* {
    static const std::map<std::string_view, const char*> TYPES = {
        {"png", "image/png"},       {"jpg", "image/jpeg"},     {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},       {"svg", "image/svg+xml"},  {"webp", "image/webp"},
        {"ico", "image/x-icon"},    {"bmp", "image/bmp"},      {"avif", "image/avif"},
        {"woff", "font/woff"},      {"woff2", "font/woff2"},   {"ttf", "font/ttf"},
        {"otf", "font/otf"},        {"eot", "application/vnd.ms-fontobject"},
        {"mp4", "video/mp4"},       {"webm", "video/webm"},    {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},       {"txt", "text/plain"},     {"wasm", "application/wasm"},
    };
    auto it = TYPES.find(ext);
    return it == TYPES.end() ? "application/octet-stream" : it->second;
}

auto base64_encode(std::string_view data) -> std::string {
    if (data.empty())
        return {};
    // 4 output bytes per 3 input bytes, plus the terminating NUL EVP writes
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(len));
    return out;
}

auto sha256_hex(std::string_view data) -> std::string {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx)
        throw std::runtime_error("EVP_MD_CTX_new failed");
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, digest, &len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok)
        throw std::runtime_error("sha256 digest failed");

    static const char* HEX = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += HEX[digest[i] >> 4];
        out += HEX[digest[i] & 0x0F];
    }
    return out;
}

auto handle_asset(const Context& context, const std::string& path)
    -> Result<std::string, BuildError> {
    auto data = plugin::read_file(path);
    if (is_err(data))
        return unwrap_err(data);
    const auto& bytes = unwrap(data);
    auto ext = extension_name(path);

    if (bytes.size() <= context.config.inline_limit)
        return std::string("data:") + mime_type(ext) + ";base64," + base64_encode(bytes);

    std::filesystem::path source(path);
    std::string output_name = source.stem().string() + "." + sha256_hex(bytes).substr(0, 8);
    if (!ext.empty())
        output_name += "." + ext;

    context.assets.insert(path, output_name);
    return output_name;
}

} // namespace loom::load
