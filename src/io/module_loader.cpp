#include "io/module_loader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace canister {

namespace {

class ScopedFd {
  public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;
    ~ScopedFd() {
        if (fd_ >= 0 && fd_ != STDIN_FILENO)
            ::close(fd_);
    }

    int Get() const { return fd_; }

  private:
    int fd_;
};

Result ErrnoFail(const std::string& what, const std::string& path) {
    return Result::Fail(ErrorKind::Validation,
                        what + ": " + path + " (" + std::strerror(errno) + ")");
}

} // namespace

Result LoadModuleImage(const std::string& path, std::vector<std::uint8_t>& out) {
    out.clear();

    const int raw = (path == "-") ? STDIN_FILENO : ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (raw < 0)
        return ErrnoFail("Failed to open module", path);
    ScopedFd fd(raw);

    struct stat st{};
    if (::fstat(fd.Get(), &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0) {
        out.reserve(static_cast<size_t>(st.st_size));
    }

    std::uint8_t buf[64 * 1024];
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf, sizeof(buf));
        if (n == 0)
            break;
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return ErrnoFail("Failed to read module", path);
        }
        out.insert(out.end(), buf, buf + n);
    }
    return Result::Ok();
}

} // namespace canister
