#include "util/file.hpp"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <fstream>
#include <memory>

#include "glog/logging.h"

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";
static const constexpr size_t kChunkSize = 32 * 1024;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  return remove(src.c_str()) != -1 ? 0 : errno;
}

// Returns errno, or 0 on success.
int OsRead(const std::string& path, std::string* content) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[kChunkSize] = {};
  ssize_t amount;
  while ((amount = read(fd, buf, kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    content->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& content,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.c_str() + pos, content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  if (close(fd) == -1) return errno;
  int error = OsAtomicMove(temp_file, path, overwrite);
  if (error) remove(temp_file.c_str());
  return error;
}

}  // namespace
#endif

namespace util {

std::string File::Read(const std::string& path) {
  std::string content;
  int err = OsRead(path, &content);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err)
    throw std::system_error(err, std::system_category(), "Read " + path);
  return content;
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) throw file_exists("Write " + path);
  int err = OsWrite(path, content, overwrite);
  if (err)
    throw std::system_error(err, std::system_category(), "Write " + path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Copy(const std::string& from, const std::string& to,
                bool overwrite) {
  Write(to, Read(from), overwrite);
  struct stat info {};
  if (stat(from.c_str(), &info) == -1 ||
      chmod(to.c_str(), info.st_mode & 07777) == -1) {
    throw std::system_error(errno, std::system_category(), "chmod " + to);
  }
}

void File::Move(const std::string& from, const std::string& to,
                bool overwrite) {
  int err = OsAtomicMove(from, to, overwrite);
  if (err == EEXIST) throw file_exists("Move " + from + " to " + to);
  if (err == ENOENT) throw file_not_found("Move " + from + " to " + to);
  if (err) {
    // Cross-device moves and file systems without hard links.
    Copy(from, to, overwrite);
    Remove(from);
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path))
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::SetPermissions(const std::string& path, uint32_t mode) {
  if (chmod(path.c_str(), mode) == -1)
    throw std::system_error(errno, std::system_category(), "chmod " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (first.empty() || strchr(kPathSeparators, second[0])) return second;
  if (strchr(kPathSeparators, first.back())) return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return path.substr(0, 1);
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

std::string File::AbsolutePath(const std::string& path) {
  char buf[PATH_MAX] = {};
  if (realpath(path.c_str(), buf) == nullptr) return "";
  return buf;
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp " + base);
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Could not clean up " << path_ << ": " << exc.what();
  }
}

}  // namespace util
