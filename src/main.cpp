#include "crypto/hash.hpp"
#include "filepipe/checksum.hpp"
#include "filepipe/config.hpp"
#include "filepipe/local.hpp"
#include "filepipe/pipeline.hpp"
#include "io/copy.hpp"
#include "io/os_file.hpp"
#include "io/os_filesystem.hpp"
#include "util/logger.hpp"

#include <cctype>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <getopt.h>
#include <memory>
#include <string>
#include <vector>

using namespace filepipe;

namespace {

struct GlobalOptions {
    ReadOptions read;
    WriteOptions write;
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-v] [-L <level>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  cat [-o <offset>] [-l <limit>] [-r] [-e <entry>] <file|->\n"
        "                         Print a file through its extension chain, or one archive entry\n"
        "  ls <file|->            List the entries of a tar or zip file\n"
        "  verify <file|-> <algo:hex>...\n"
        "                         Check digests (sha256, sha1, sha512, md5, crc32); a trailing\n"
        "                         '*' matches a digest prefix\n"
        "  pack <dir> <out>       Pack a directory into a .tar, .tgz, .tar.gz or .zip\n"
        "\n"
        "Options:\n"
        "  -c, --config           JSON file with \"read\" and \"write\" option sections\n"
        "  -v, --verbose          Debug logging\n"
        "  -L, --log-level        debug, info, warn, error or none (default info)\n"
        "  -h, --help             Show this help\n",
        argv);
}

bool ParseInt64(const char *s, std::int64_t &out) {
    char *end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0') return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

Result OpenInput(const std::string &path, const ReadOptions &opts, std::unique_ptr<Reader> &out) {
    if (path == "-") {
        std::unique_ptr<IFile> f;
        auto r = OpenOsFile(path, f);
        if (!r.ok) return r;
        return Reader::Open(std::move(f), opts, out);
    }
    return ReadLocal(path, opts, out);
}

void CloseReader(Reader &r, const std::string &path) {
    auto c = r.Close();
    if (!c.ok) LogWarn("close %s: %s", path.c_str(), c.msg.c_str());
}

int CatZipEntry(Reader &reader, const std::string &entry) {
    std::unique_ptr<IFile> f;
    if (auto r = reader.ZipOpen(entry, f); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }
    auto out = OsWritableFile::Stdout();
    auto r = Copy(*out, *f);
    auto c = f->Close();
    r = Result::Combine({r, c});
    if (!r.ok) {
        LogError("%s: %s", entry.c_str(), r.msg.c_str());
        return 1;
    }
    return 0;
}

int CatTar(Reader &reader, const std::string &entry) {
    auto out = OsWritableFile::Stdout();
    for (;;) {
        TarHeader hdr;
        auto r = reader.TarNext(hdr);
        if (IsEof(r)) break;
        if (!r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
        if (hdr.IsDir() || hdr.typeflag != kTarTypeReg) continue;
        if (!entry.empty() && hdr.name != entry) continue;
        std::uint64_t n = 0;
        if (auto w = reader.WriteTo(*out, n); !w.ok) {
            LogError("%s: %s", hdr.name.c_str(), w.msg.c_str());
            return 1;
        }
        if (!entry.empty()) return 0;
    }
    if (!entry.empty()) {
        LogError("%s: no such entry", entry.c_str());
        return 1;
    }
    return 0;
}

int CmdCat(int argc, char **argv, GlobalOptions &g) {
    ReadOptions opts = g.read;
    std::string entry;

    static option long_opts[] = {
        {"offset", required_argument, nullptr, 'o'},
        {"limit", required_argument, nullptr, 'l'},
        {"raw", no_argument, nullptr, 'r'},
        {"entry", required_argument, nullptr, 'e'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "o:l:re:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'o':
                if (!ParseInt64(optarg, opts.offset)) {
                    std::fprintf(stderr, "Invalid --offset: %s\n", optarg);
                    return 2;
                }
                break;

            case 'l':
                if (!ParseInt64(optarg, opts.limit)) {
                    std::fprintf(stderr, "Invalid --limit: %s\n", optarg);
                    return 2;
                }
                break;

            case 'r':
                opts.raw = true;
                break;

            case 'e':
                entry = optarg;
                break;

            default:
                return 2;
        }
    }
    if (optind + 1 != argc) {
        std::fprintf(stderr, "cat: expected one file\n");
        return 2;
    }

    const std::string path = argv[optind];
    std::unique_ptr<Reader> reader;
    if (auto r = OpenInput(path, opts, reader); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    int rc = 0;
    if (reader->ZipEnabled()) {
        if (entry.empty()) {
            LogError("%s: zip archive, choose an entry with -e", path.c_str());
            rc = 2;
        } else {
            rc = CatZipEntry(*reader, entry);
        }
    } else if (reader->TarEnabled()) {
        rc = CatTar(*reader, entry);
    } else {
        auto out = OsWritableFile::Stdout();
        std::uint64_t n = 0;
        if (auto r = reader->WriteTo(*out, n); !r.ok) {
            LogError("%s: %s", path.c_str(), r.msg.c_str());
            rc = 1;
        }
    }
    CloseReader(*reader, path);
    return rc;
}

void PrintEntry(const FileInfo &info, const std::string &name) {
    std::printf("%06o %12" PRIu64 " %s\n", info.mode, info.size, name.c_str());
}

int CmdLs(int argc, char **argv, GlobalOptions &g) {
    if (argc != 2) {
        std::fprintf(stderr, "ls: expected one file\n");
        return 2;
    }
    const std::string path = argv[1];
    std::unique_ptr<Reader> reader;
    if (auto r = OpenInput(path, g.read, reader); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    int rc = 0;
    if (reader->TarEnabled()) {
        Result err;
        reader->IterTarHeaders(&err).ForEach([](const TarHeader &hdr) {
            PrintEntry(hdr.ToFileInfo(), hdr.name);
            return true;
        });
        if (!err.ok) {
            LogError("%s: %s", path.c_str(), err.msg.c_str());
            rc = 1;
        }
    } else if (reader->ZipEnabled()) {
        std::vector<ZipFile> files;
        if (auto r = reader->ZipFiles(files); !r.ok) {
            LogError("%s", r.msg.c_str());
            rc = 1;
        }
        for (const auto &f : files) PrintEntry(f.ToFileInfo(), f.name);
    } else {
        LogError("%s: not a tar or zip file", path.c_str());
        rc = 2;
    }
    CloseReader(*reader, path);
    return rc;
}

bool ParseChecksum(const std::string &arg, HashChecksum &out) {
    const auto colon = arg.find(':');
    if (colon == std::string::npos) return false;
    std::string algo = arg.substr(0, colon);
    for (auto &ch : algo) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    out.new_hash = crypto::FactoryByName(algo);
    if (!out.new_hash) return false;
    out.want_hex = arg.substr(colon + 1);
    out.is_prefix = false;
    if (!out.want_hex.empty() && out.want_hex.back() == '*') {
        out.want_hex.pop_back();
        out.is_prefix = true;
    }
    return !out.want_hex.empty();
}

int CmdVerify(int argc, char **argv) {
    if (argc < 2) {
        std::fprintf(stderr, "verify: expected a file\n");
        return 2;
    }
    const std::string path = argv[1];
    std::vector<HashChecksum> cs;
    for (int i = 2; i < argc; ++i) {
        HashChecksum c;
        if (!ParseChecksum(argv[i], c)) {
            std::fprintf(stderr, "Invalid checksum: %s\n", argv[i]);
            return 2;
        }
        cs.push_back(std::move(c));
    }

    if (!VerifyLocalChecksum(path, cs)) {
        std::printf("%s: FAILED\n", path.c_str());
        return 1;
    }
    std::printf("%s: OK\n", path.c_str());
    return 0;
}

int CmdPack(int argc, char **argv, GlobalOptions &g) {
    if (argc != 3) {
        std::fprintf(stderr, "pack: expected <dir> <out>\n");
        return 2;
    }
    const std::string dir = argv[1];
    const std::string out = argv[2];

    FileInfo info;
    if (auto r = StatPath(dir, info); !r.ok || !info.IsDir()) {
        LogError("%s: not a directory", dir.c_str());
        return 1;
    }
    if (g.write.raw) {
        LogError("pack: raw output has no archive stage");
        return 2;
    }
    std::vector<Stage> chain = ParseExtensionChain(out, true);
    if (chain.empty() || (chain.back() != Stage::kTar && chain.back() != Stage::kZip)) {
        LogError("%s: output must end in .tar, .tgz, .tar.gz or .zip", out.c_str());
        return 2;
    }

    std::unique_ptr<Writer> w;
    if (auto r = WriteTrunc(out, 0644, true, g.write, w); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }
    LogDebug("pack %s -> %s (%s)", dir.c_str(), out.c_str(), DescribeChain(chain).c_str());

    OsFileSystem fsys(dir);
    Result r = w->TarEnabled() ? w->TarAddFs(fsys) : w->ZipAddFs(fsys);
    r = Result::Combine({r, w->Close()});
    if (!r.ok) {
        LogError("%s: %s", out.c_str(), r.msg.c_str());
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"log-level", required_argument, nullptr, 'L'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    // '+' stops at the command name so that its own options are left alone.
    while ((c = getopt_long(argc, argv, "+hc:vL:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'v':
                Logger::Instance().SetLevel(LogLevel::Debug);
                break;

            case 'L': {
                LogLevel lvl;
                if (!ParseLogLevel(optarg, lvl)) {
                    std::fprintf(stderr, "Invalid --log-level: %s\n", optarg);
                    return 2;
                }
                Logger::Instance().SetLevel(lvl);
                break;
            }

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    GlobalOptions g;
    if (!config_path.empty()) {
        if (auto r = config::LoadOptionsFile(config_path, &g.read, &g.write); !r.ok) {
            LogError("cannot load config: %s: %s", config_path.c_str(), r.msg.c_str());
            return 1;
        }
    }

    const std::string cmd = argv[optind];
    const int sub_argc = argc - optind;
    char **sub_argv = argv + optind;

    try {
        if (cmd == "cat") return CmdCat(sub_argc, sub_argv, g);
        if (cmd == "ls") return CmdLs(sub_argc, sub_argv, g);
        if (cmd == "verify") return CmdVerify(sub_argc, sub_argv);
        if (cmd == "pack") return CmdPack(sub_argc, sub_argv, g);
    } catch (const std::exception &e) {
        LogError("%s: %s", cmd.c_str(), e.what());
        return 1;
    }

    std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
    PrintUsage(argv[0]);
    return 2;
}
