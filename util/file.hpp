#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cstdint>
#include <string>
#include <system_error>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

class File {
 public:
  // Reads the whole file. Throws file_not_found if it does not exist.
  static std::string Read(const std::string& path);

  // Writes content to path, going through a temporary file so that readers
  // never observe a partially written file.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = false);

  // Creates path and every missing directory above it.
  static void MakeDirs(const std::string& path);

  // Copies content and permission bits.
  static void Copy(const std::string& from, const std::string& to,
                   bool overwrite = false);

  // Renames a file, copying it when a rename is not possible. Without
  // overwrite, an existing destination is left alone and file_exists thrown.
  static void Move(const std::string& from, const std::string& to,
                   bool overwrite = false);

  static void Remove(const std::string& path);

  // Changes the permission bits of a file or directory.
  static void SetPermissions(const std::string& path, uint32_t mode);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Appends second to first, unless second is absolute.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Everything before the last separator; "." if there is none.
  static std::string BaseDir(const std::string& path);

  // Computes the last component of a path.
  static std::string BaseName(const std::string& path);

  // Resolves path against the current directory. Returns an empty string if
  // the path does not exist.
  static std::string AbsolutePath(const std::string& path);

  // Negative if the file cannot be opened.
  static int64_t Size(const std::string& path);
};

// A fresh directory under base, removed with all its content on destruction
// unless Keep was called.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  void Keep();
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
