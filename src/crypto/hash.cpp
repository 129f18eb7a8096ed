#include "crypto/hash.hpp"

#include "util/hex.hpp"

#include <openssl/evp.h>
#include <zlib.h>

#include <stdexcept>

namespace filepipe::crypto {

namespace {

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

class EvpHash final : public IHash {
public:
    explicit EvpHash(const EVP_MD* md) : md_(md) {
        if (!ctx_.ok() || EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    void Update(std::span<const std::uint8_t> data) override {
        if (data.empty()) return;
        if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    // Finalizes a copy so the running state is untouched.
    std::vector<std::uint8_t> Sum() const override {
        EvpCtx copy;
        if (!copy.ok() || EVP_MD_CTX_copy_ex(copy.get(), ctx_.get()) != 1) {
            throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
        }
        std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(copy.get(), out.data(), &len) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        out.resize(len);
        return out;
    }

    void Reset() override {
        if (EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    size_t Size() const override { return static_cast<size_t>(EVP_MD_size(md_)); }

private:
    const EVP_MD* md_;
    EvpCtx ctx_;
};

class Crc32Hash final : public IHash {
public:
    void Update(std::span<const std::uint8_t> data) override {
        while (!data.empty()) {
            const size_t chunk = data.size() < (1u << 30) ? data.size() : (1u << 30);
            crc_ = ::crc32(crc_, data.data(), static_cast<uInt>(chunk));
            data = data.subspan(chunk);
        }
    }

    std::vector<std::uint8_t> Sum() const override {
        return {static_cast<std::uint8_t>(crc_ >> 24), static_cast<std::uint8_t>(crc_ >> 16),
                static_cast<std::uint8_t>(crc_ >> 8), static_cast<std::uint8_t>(crc_)};
    }

    void Reset() override { crc_ = ::crc32(0L, Z_NULL, 0); }
    size_t Size() const override { return 4; }

private:
    uLong crc_ = ::crc32(0L, Z_NULL, 0);
};

HashFactory EvpFactory(const EVP_MD* (*md)()) {
    return [md]() -> std::unique_ptr<IHash> { return std::make_unique<EvpHash>(md()); };
}

} // namespace

HashFactory Sha256Factory() { return EvpFactory(EVP_sha256); }
HashFactory Sha1Factory() { return EvpFactory(EVP_sha1); }
HashFactory Sha512Factory() { return EvpFactory(EVP_sha512); }
HashFactory Md5Factory() { return EvpFactory(EVP_md5); }

HashFactory Crc32Factory() {
    return []() -> std::unique_ptr<IHash> { return std::make_unique<Crc32Hash>(); };
}

HashFactory FactoryByName(const std::string& name) {
    if (name == "sha256") return Sha256Factory();
    if (name == "sha1") return Sha1Factory();
    if (name == "sha512") return Sha512Factory();
    if (name == "md5") return Md5Factory();
    if (name == "crc32") return Crc32Factory();
    return {};
}

std::string HexDigest(const HashFactory& factory, std::span<const std::uint8_t> data) {
    auto h = factory();
    h->Update(data);
    return HexEncode(h->Sum());
}

} // namespace filepipe::crypto
