#include "filepipe/checksum.hpp"

#include "io/copy.hpp"
#include "io/multi_writer.hpp"
#include "util/hex.hpp"
#include "util/logger.hpp"

#include <memory>
#include <stdexcept>

namespace filepipe {

namespace {

class DiscardWriter final : public IWriter {
public:
    Result WriteAll(std::span<const std::uint8_t>) override { return Result::Ok(); }
};

std::vector<std::unique_ptr<crypto::IHash>> NewHashes(const std::vector<HashChecksum>& cs) {
    std::vector<std::unique_ptr<crypto::IHash>> hs;
    hs.reserve(cs.size());
    for (const auto& c : cs) {
        if (!c.new_hash) throw std::invalid_argument("checksum: hash factory is empty");
        if (c.want_hex.empty()) throw std::invalid_argument("checksum: expected hex is empty");
        auto h = c.new_hash();
        if (!h) throw std::invalid_argument("checksum: hash factory returned null");
        hs.push_back(std::move(h));
    }
    return hs;
}

bool Verify(IFile& file, const std::vector<HashChecksum>& cs, std::vector<std::unique_ptr<crypto::IHash>>& hs) {
    std::vector<IWriter*> ws;
    ws.reserve(hs.size());
    for (auto& h : hs) ws.push_back(h.get());

    Result r;
    if (ws.empty()) {
        DiscardWriter discard;
        r = Copy(discard, file);
    } else {
        MultiWriter mw(std::move(ws));
        r = Copy(mw, file);
    }
    if (!r.ok) {
        LogDebug("checksum: read failed: %s", r.msg.c_str());
        return false;
    }
    for (size_t i = 0; i < cs.size(); ++i) {
        if (!CanEncodeToHex(hs[i]->Sum(), cs[i].want_hex, cs[i].is_prefix)) return false;
    }
    return true;
}

} // namespace

bool VerifyChecksum(IFile* file, bool close_file, const std::vector<HashChecksum>& cs) {
    if (!file) throw std::invalid_argument("checksum: file is null");
    std::vector<std::unique_ptr<crypto::IHash>> hs;
    try {
        hs = NewHashes(cs);
    } catch (const std::invalid_argument&) {
        if (close_file) {
            auto r = file->Close();
            if (!r.ok) LogWarn("checksum: close: %s", r.msg.c_str());
        }
        throw;
    }
    const bool ok = Verify(*file, cs, hs);
    if (close_file) {
        auto r = file->Close();
        if (!r.ok) LogWarn("checksum: close: %s", r.msg.c_str());
    }
    return ok;
}

bool VerifyChecksumFromFs(IFileSystem* fsys, const std::string& name, const std::vector<HashChecksum>& cs) {
    if (!fsys) throw std::invalid_argument("checksum: file system is null");
    // Reject malformed checksums before touching the file system.
    (void)NewHashes(cs);
    std::unique_ptr<IFile> f;
    auto r = fsys->Open(name, f);
    if (!r.ok) return false;
    return VerifyChecksum(f.get(), true, cs);
}

} // namespace filepipe
