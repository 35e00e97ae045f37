#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <string>
#include <vector>

#include <kj/common.h>
#include <kj/function.h>

namespace util {

static const constexpr uint32_t kChunkSize = 64 * 1024;

class File {
 public:
  // Bytes owned by whoever produced them, valid until the next call.
  using Chunk = kj::ArrayPtr<const kj::byte>;

  // Returns the next part of the source on each call, an empty Chunk at the
  // end.
  using ChunkProducer = kj::Function<Chunk()>;

  // Full paths of the direct children of a directory, in no particular order.
  // A missing directory has none.
  static std::vector<std::string> ListEntries(const std::string& path);

  // Opens path for reading; the file is closed with the producer.
  static ChunkProducer Read(const std::string& path);

  // Writes content to path. The data goes to a temporary file in the same
  // directory, which takes the final name only once complete. Without
  // overwrite an existing file is an error.
  static void WriteContent(const std::string& path, const std::string& content,
                           bool overwrite = false);

  // mkdir -p.
  static void MakeDirs(const std::string& path);

  // rm -rf that never follows symlinks or leaves the file system, and
  // restores permissions of directories the owner locked itself out of.
  static void RemoveTree(const std::string& path);

  // Leaves only the owner read bit.
  static void MakeImmutable(const std::string& path);

  // An absolute second path is returned as is.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  static std::string BaseDir(const std::string& path);
  static std::string BaseName(const std::string& path);

  // -1 if the file cannot be stat'ed.
  static int64_t Size(const std::string& path);

  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// A private (0700) directory with a unique name under base, created on
// construction and removed with all its content on destruction. The name is
// prefix followed by random characters.
class TempDir {
 public:
  explicit TempDir(const std::string& base, const std::string& prefix = "");

  const std::string& Path() const;

  // Throws if the removal fails. Later calls do nothing.
  void Remove();

  bool Removed() const { return removed_; }

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    removed_ = other.removed_;
    other.removed_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool removed_ = false;
};

}  // namespace util

#endif
