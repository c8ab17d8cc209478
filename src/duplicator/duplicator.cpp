#include "dirimg/duplicator.hpp"

#include <cerrno>
#include <string>
#include <system_error>

#if defined(__linux__)
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace dirimg::duplicator {
namespace {

#if defined(__linux__)
class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
  ~FileDescriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  [[nodiscard]] int get() const { return fd_; }

 private:
  int fd_ = -1;
};

std::system_error ErrnoError(int err, const std::string& message) {
  return std::system_error(err, std::generic_category(), "duplicator: " + message);
}

// False when the filesystem cannot share extents between these files; the caller then copies.
bool TryReflink(const std::filesystem::path& src, const std::filesystem::path& dst) {
  FileDescriptor in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
  if (in.get() < 0) {
    throw ErrnoError(errno, "failed to open " + src.string());
  }
  struct stat info {};
  if (::fstat(in.get(), &info) != 0) {
    throw ErrnoError(errno, "failed to stat " + src.string());
  }
  FileDescriptor out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, info.st_mode & 07777));
  if (out.get() < 0) {
    throw ErrnoError(errno, "failed to create " + dst.string());
  }
  if (::ioctl(out.get(), FICLONE, in.get()) == 0) {
    return true;
  }
  const int err = errno;
  if (err == EOPNOTSUPP || err == ENOTTY || err == EXDEV || err == EINVAL || err == ENOSYS) {
    return false;
  }
  throw ErrnoError(err, "clone of " + src.string() + " failed");
}
#endif

}  // namespace

void CloneFile(const std::filesystem::path& src, const std::filesystem::path& dst) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(src, ec)) {
    throw std::filesystem::filesystem_error(
        "duplicator: source is not a regular file", src, dst,
        ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
  }
  if (std::filesystem::exists(dst, ec) && std::filesystem::equivalent(src, dst, ec)) {
    return;
  }

#if defined(__linux__)
  if (TryReflink(src, dst)) {
    return;
  }
#endif
  std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing);
}

void CloneDirectory(const std::filesystem::path& src_dir, const std::filesystem::path& dst_dir) {
  std::filesystem::create_directories(dst_dir);
  for (const auto& entry : std::filesystem::directory_iterator(src_dir)) {
    const auto dst_path = dst_dir / entry.path().filename();
    if (entry.is_symlink()) {
      std::error_code ec;
      std::filesystem::remove(dst_path, ec);
      std::filesystem::copy_symlink(entry.path(), dst_path);
    } else if (entry.is_directory()) {
      CloneDirectory(entry.path(), dst_path);
    } else {
      CloneFile(entry.path(), dst_path);
    }
  }
}

}  // namespace dirimg::duplicator
