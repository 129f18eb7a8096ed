#pragma once

#include "io/io.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace filepipe::crypto {

// Streaming digest state. Writing never fails once the state is valid.
class IHash : public IWriter {
public:
    virtual void Update(std::span<const std::uint8_t> data) = 0;
    // Digest of everything written so far; the state keeps accumulating.
    virtual std::vector<std::uint8_t> Sum() const = 0;
    virtual void Reset() = 0;
    virtual size_t Size() const = 0;

    Result WriteAll(std::span<const std::uint8_t> in) override {
        Update(in);
        return Result::Ok();
    }
};

using HashFactory = std::function<std::unique_ptr<IHash>()>;

HashFactory Sha256Factory();
HashFactory Sha1Factory();
HashFactory Sha512Factory();
HashFactory Md5Factory();
// CRC-32 (IEEE); the digest is the big-endian checksum.
HashFactory Crc32Factory();

// Looks up a factory by lowercase name ("sha256", "sha1", "sha512", "md5",
// "crc32"). Returns an empty factory for unknown names.
HashFactory FactoryByName(const std::string& name);

// Lowercase hex digest of data.
std::string HexDigest(const HashFactory& factory, std::span<const std::uint8_t> data);

} // namespace filepipe::crypto
