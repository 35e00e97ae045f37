#include "util/file.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <system_error>

#include <kj/debug.h>
#include <kj/io.h>

namespace util {

namespace {

const char kSeparator = '/';
const int kMaxOpenDirs = 64;

[[noreturn]] void ThrowErrno(const std::string& what, int err = errno) {
  throw std::system_error(err, std::system_category(), what);
}

// mkdtemp and mkostemp rewrite the trailing XXXXXX in place.
std::vector<char> Template(const std::string& prefix) {
  std::string pattern = prefix + "XXXXXX";
  return std::vector<char>(pattern.c_str(),
                           pattern.c_str() + pattern.size() + 1);
}

// nftw gives no way to pass state to the callback.
thread_local bool tree_had_unreadable_dirs = false;

int UnlockDirectory(const char* path, const struct stat* /*st*/, int type,
                    struct FTW* /*ftw*/) {
  if (type == FTW_DNR) tree_had_unreadable_dirs = true;
  // Symlinks are reported as FTW_SL under FTW_PHYS and never chmod'ed.
  if (type == FTW_D || type == FTW_DNR) chmod(path, S_IRWXU);
  return 0;
}

int RemoveEntry(const char* path, const struct stat* /*st*/, int /*type*/,
                struct FTW* /*ftw*/) {
  return remove(path);
}

// A directory that could not be read hides its children, which are only
// visited on the next walk once it is unlocked.
void UnlockTree(const std::string& path) {
  for (int depth = 0; depth < kMaxOpenDirs; depth++) {
    tree_had_unreadable_dirs = false;
    nftw(path.c_str(), UnlockDirectory, kMaxOpenDirs, FTW_PHYS | FTW_MOUNT);
    if (!tree_had_unreadable_dirs) return;
  }
}

// Moves a finished temporary file to its final name. link() fails with EEXIST
// instead of replacing the destination.
void Publish(const std::string& temp_file, const std::string& path,
             bool overwrite) {
  if (overwrite) {
    if (rename(temp_file.c_str(), path.c_str()) == -1) {
      ThrowErrno("rename " + path);
    }
    return;
  }
  if (link(temp_file.c_str(), path.c_str()) == -1) ThrowErrno("link " + path);
  unlink(temp_file.c_str());
}

void WriteAll(int fd, const std::string& content, const std::string& path) {
  const char* data = content.data();
  size_t left = content.size();
  while (left > 0) {
    ssize_t written = write(fd, data, left);
    if (written == -1) {
      if (errno == EINTR) continue;
      ThrowErrno("write " + path);
    }
    data += written;
    left -= written;
  }
}

}  // namespace

std::vector<std::string> File::ListEntries(const std::string& path) {
  std::vector<std::string> entries;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    if (errno == ENOENT) return entries;
    ThrowErrno("opendir " + path);
  }
  KJ_DEFER(closedir(dir));
  while (struct dirent* entry = readdir(dir)) {  // NOLINT
    std::string name = entry->d_name;
    if (name != "." && name != "..") entries.push_back(JoinPath(path, name));
  }
  return entries;
}

File::ChunkProducer File::Read(const std::string& path) {
  kj::AutoCloseFd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));  // NOLINT
  if (fd.get() == -1) ThrowErrno("open " + path);
  auto buffer = std::make_unique<kj::byte[]>(kChunkSize);
  return [fd = kj::mv(fd), buffer = std::move(buffer), path]() mutable {
    if (fd.get() == -1) return Chunk();
    for (;;) {
      ssize_t amount = read(fd, buffer.get(), kChunkSize);
      if (amount > 0) return Chunk(buffer.get(), amount);
      if (amount == 0) break;
      if (errno == EINTR) continue;
      int err = errno;
      fd = nullptr;
      ThrowErrno("read " + path, err);
    }
    fd = nullptr;
    return Chunk();
  };
}

void File::WriteContent(const std::string& path, const std::string& content,
                        bool overwrite) {
  MakeDirs(BaseDir(path));
  std::vector<char> name = Template(path + ".");
  kj::AutoCloseFd fd(mkostemp(name.data(), O_CLOEXEC));
  if (fd.get() == -1) ThrowErrno("mkostemp " + path);
  std::string temp_file = name.data();
  bool published = false;
  KJ_DEFER(if (!published) unlink(temp_file.c_str()));
  WriteAll(fd, content, temp_file);
  if (fsync(fd) == -1) ThrowErrno("fsync " + temp_file);
  fd = nullptr;
  Publish(temp_file, path, overwrite);
  published = true;
}

void File::MakeDirs(const std::string& path) {
  size_t end = 0;
  do {
    end = path.find(kSeparator, end + 1);
    std::string prefix = path.substr(0, end);
    if (prefix.empty()) continue;
    if (mkdir(prefix.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) == -1 &&
        errno != EEXIST) {
      ThrowErrno("mkdir " + prefix);
    }
  } while (end != std::string::npos);
}

void File::RemoveTree(const std::string& path) {
  UnlockTree(path);
  if (nftw(path.c_str(), RemoveEntry, kMaxOpenDirs,
           FTW_DEPTH | FTW_PHYS | FTW_MOUNT) == -1) {
    ThrowErrno("remove " + path);
  }
}

void File::MakeImmutable(const std::string& path) {
  if (chmod(path.c_str(), S_IRUSR) == -1) ThrowErrno("chmod " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && second[0] == kSeparator) return second;
  return first + kSeparator + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t last = path.rfind(kSeparator);
  return last == std::string::npos ? "" : path.substr(0, last);
}

std::string File::BaseName(const std::string& path) {
  size_t last = path.rfind(kSeparator);
  return last == std::string::npos ? path : path.substr(last + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0 ? st.st_size : -1;
}

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  std::vector<char> name = Template(File::JoinPath(base, prefix));
  if (mkdtemp(name.data()) == nullptr) ThrowErrno("mkdtemp " + base);
  path_ = name.data();
}

const std::string& TempDir::Path() const { return path_; }

void TempDir::Remove() {
  if (removed_) return;
  removed_ = true;
  File::RemoveTree(path_);
}

TempDir::~TempDir() {
  try {
    Remove();
  } catch (const std::system_error& exc) {
    KJ_LOG(ERROR, "Cannot remove temporary directory", path_, exc.what());
  }
}

}  // namespace util
