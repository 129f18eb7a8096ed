#include "archive/libarchive_adapter.hpp"

#include <cerrno>
#include <vector>

namespace filepipe {

namespace {

struct ReaderCtx {
    IReader* reader = nullptr;
    std::vector<std::uint8_t> buffer;

    explicit ReaderCtx(IReader& in, size_t buffer_size = 64 * 1024)
        : reader(&in), buffer(buffer_size) {}
};

la_ssize_t ReadCb(struct archive* ar, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<ReaderCtx*>(client_data);
    const ssize_t n = ctx->reader->Read(std::span<std::uint8_t>(ctx->buffer.data(), ctx->buffer.size()));
    if (n < 0) {
        const auto err = ctx->reader->LastError();
        archive_set_error(ar, err.err > 0 ? err.err : EIO, "%s", err.msg.c_str());
        return -1;
    }

    *out_buf = ctx->buffer.data();
    return static_cast<la_ssize_t>(n);
}

int CloseCb(struct archive*, void* client_data) {
    delete static_cast<ReaderCtx*>(client_data);
    return ARCHIVE_OK;
}

la_ssize_t WriteCb(struct archive* ar, void* client_data, const void* buf, size_t n) {
    auto* sink = static_cast<ArchiveSink*>(client_data);
    auto r = sink->writer->WriteAll(std::span<const std::uint8_t>(static_cast<const std::uint8_t*>(buf), n));
    if (!r.ok) {
        if (sink->err.ok) sink->err = r;
        archive_set_error(ar, r.err > 0 ? r.err : EIO, "%s", r.msg.c_str());
        return -1;
    }
    return static_cast<la_ssize_t>(n);
}

} // namespace

int OpenArchiveFromReader(struct archive* ar, IReader& reader) {
    // ctx is released by CloseCb, also when the open fails and ar is freed.
    auto* ctx = new ReaderCtx(reader);
    return archive_read_open2(ar, ctx, nullptr, ReadCb, nullptr, CloseCb);
}

int OpenArchiveToWriter(struct archive* ar, ArchiveSink& sink) {
    return archive_write_open(ar, &sink, nullptr, WriteCb, nullptr);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace filepipe
