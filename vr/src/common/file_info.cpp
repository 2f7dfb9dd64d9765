/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/internal/file_info.hpp"
#include "vr/internal/utils.hpp"
#include "vr/errors.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <vector>

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <openssl/evp.h>

namespace vr::internal {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};

// Closes the fd on scope exit.
class FdGuard {
public:
    explicit FdGuard(int fd) : _fd(fd) {}
    ~FdGuard() { if (_fd >= 0) ::close(_fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    int get() const { return _fd; }
private:
    int _fd;
};

} // namespace

bool sha256_file_hex(const std::string& path, std::string& out) {
    FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) return false;

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) return false;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return false;

    std::vector<char> buf(64 * 1024);
    while (true) {
        ssize_t n = ::read(fd.get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) != 1) {
            return false;
        }
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) return false;
    out = bytes_to_hex(md, md_len);
    return true;
}

vr::FileInfo inspect_file(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        throw vr::ConfigError("File not found: " + path + " (" + std::strerror(errno) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        throw vr::ConfigError("Not a regular file: " + path);
    }

    vr::FileInfo fi;
    fi.path = path;
    fi.name = base_name(path);
    fi.size = static_cast<std::uint64_t>(st.st_size);
    if (!sha256_file_hex(path, fi.sha256)) {
        throw vr::ConfigError("Cannot read file: " + path);
    }
    return fi;
}

} // namespace vr::internal
