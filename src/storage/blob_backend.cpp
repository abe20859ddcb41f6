#include "model_cache/blob_backend.hpp"
#include "model_cache/integrity.hpp"
#include "model_cache/json_fields.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace model_cache {
namespace {
#pragma pack(push, 1)
struct BlobHeader {
  std::uint32_t magic;
  std::uint32_t checksum;
  std::uint32_t meta_len;
  std::uint64_t payload_len;
  std::uint8_t reserved[8];
};
#pragma pack(pop)

constexpr std::uint32_t kMagic = 0x4d434231; // MCB1
constexpr std::uint32_t kMaxMetaLen = 64 * 1024;
constexpr const char *kTmpSuffix = ".tmp";
// Leaves room for the temp-file prefix and suffix under NAME_MAX.
constexpr std::size_t kMaxEncodedName = 200;

// Covers the header and the metadata block. Payload bytes are covered by the
// entry's SHA-256 checksum instead.
std::uint32_t header_checksum(const BlobHeader &h, const std::string &meta) {
  std::uint32_t sum = 2166136261u;
  auto mix = [&](std::uint8_t b) {
    sum ^= b;
    sum *= 16777619u;
  };
  auto *p = reinterpret_cast<const std::uint8_t *>(&h);
  for (std::size_t i = 0; i < sizeof(BlobHeader); ++i) {
    if (i >= offsetof(BlobHeader, checksum) &&
        i < offsetof(BlobHeader, checksum) + sizeof(h.checksum))
      continue;
    mix(p[i]);
  }
  for (unsigned char c : meta)
    mix(c);
  return sum;
}

bool fsync_dir(const std::string &dir) {
  int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd < 0)
    return false;
  bool ok = ::fsync(dfd) == 0;
  close(dfd);
  return ok;
}

bool write_all(int fd, const void *data, std::size_t len) {
  const auto *p = static_cast<const std::uint8_t *>(data);
  while (len > 0) {
    ssize_t n = ::write(fd, p, len);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    p += n;
    len -= static_cast<std::size_t>(n);
  }
  return true;
}

bool pread_all(int fd, void *data, std::size_t len, off_t off) {
  auto *p = static_cast<std::uint8_t *>(data);
  while (len > 0) {
    ssize_t n = ::pread(fd, p, len, off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    if (n == 0)
      return false;
    p += n;
    off += n;
    len -= static_cast<std::size_t>(n);
  }
  return true;
}

// Keeps [A-Za-z0-9._-] and percent-encodes everything else so that any id
// maps to exactly one flat file name. Names that would outgrow
// kMaxEncodedName become "%h" + sha256(id); the encoder only emits '%'
// before uppercase hex, so the two forms never collide.
std::string encode_file_name(const std::string &id) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(id.size());
  for (unsigned char c : id) {
    const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                      (c >= '0' && c <= '9') || c == '.' || c == '_' ||
                      c == '-';
    if (safe && !(out.empty() && c == '.')) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xF]);
    }
    if (out.size() > kMaxEncodedName)
      return "%h" + sha256_hex(std::vector<std::uint8_t>(id.begin(), id.end()));
  }
  return out;
}

std::string errno_text(const std::string &what, const std::string &path) {
  return what + " " + path + ": " + std::strerror(errno);
}

} // namespace

BlobBackend::BlobBackend(BlobStoreConfig cfg) : cfg_(std::move(cfg)) {}

bool BlobBackend::init(std::string *err) {
  std::error_code ec;
  std::filesystem::create_directories(models_dir(), ec);
  if (ec) {
    if (err)
      *err = "cannot create " + models_dir() + ": " + ec.message();
    return false;
  }
  auto start = std::chrono::steady_clock::now();
  index_.clear();
  if (!scan_models_dir(err))
    return false;
  stats_.index_rebuild_ms = static_cast<std::size_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count());
  ready_ = true;
  return true;
}

std::string BlobBackend::request_path(const std::string &id) {
  return "/models/" + id;
}

std::string BlobBackend::meta_to_header(const ModelMeta &m) {
  std::ostringstream os;
  os << "{\"id\":\"" << json_escape(m.id) << "\",\"size\":" << m.size_bytes
     << ",\"timestamp\":" << to_epoch_ms(m.created_at)
     << ",\"lastAccessed\":" << to_epoch_ms(m.last_accessed)
     << ",\"version\":\"" << json_escape(m.version) << "\",\"checksum\":\""
     << json_escape(m.checksum) << "\"}";
  return os.str();
}

bool BlobBackend::parse_meta_header(const std::string &header,
                                    ModelMeta *out) {
  auto id = json_string(header, "id");
  auto size = json_u64(header, "size");
  auto created = json_i64(header, "timestamp");
  auto accessed = json_i64(header, "lastAccessed");
  if (!id || !size || !created || !accessed)
    return false;
  out->id = *id;
  out->size_bytes = static_cast<std::size_t>(*size);
  out->created_at = from_epoch_ms(*created);
  out->last_accessed = from_epoch_ms(*accessed);
  out->version = json_string(header, "version").value_or("");
  out->checksum = json_string(header, "checksum").value_or("");
  return true;
}

bool BlobBackend::put(const CacheEntry &entry, std::string *err) {
  if (!ready_) {
    if (err)
      *err = "blob store not initialized";
    return false;
  }
  if (entry.meta.id.empty()) {
    if (err)
      *err = "empty model id";
    return false;
  }
  if (entry.meta.size_bytes != entry.payload.size()) {
    if (err)
      *err = "size does not match payload for " + entry.meta.id;
    return false;
  }
  const std::string header = meta_to_header(entry.meta);
  if (header.size() > kMaxMetaLen) {
    if (err)
      *err = "metadata header too large for " + entry.meta.id;
    return false;
  }
  if (!write_record(file_path(entry.meta.id), header, entry.payload, err))
    return false;
  index_[entry.meta.id] = entry.meta;
  ++stats_.puts;
  return true;
}

std::optional<CacheEntry> BlobBackend::get(const std::string &id,
                                           std::string *err) {
  if (!ready_) {
    if (err)
      *err = "blob store not initialized";
    return std::nullopt;
  }
  ++stats_.gets;
  auto it = index_.find(id);
  if (it == index_.end())
    return std::nullopt;
  CacheEntry e;
  std::string read_err;
  if (!read_record(file_path(id), &e.meta, &e.payload, &read_err)) {
    if (read_err.empty()) {
      // Vanished or torn underneath us: the response no longer exists.
      index_.erase(it);
      return std::nullopt;
    }
    if (err)
      *err = read_err;
    return std::nullopt;
  }
  if (e.meta.id != id) {
    index_.erase(it);
    return std::nullopt;
  }
  return e;
}

std::optional<ModelMeta> BlobBackend::stat(const std::string &id,
                                           std::string *err) {
  if (!ready_) {
    if (err)
      *err = "blob store not initialized";
    return std::nullopt;
  }
  auto it = index_.find(id);
  if (it == index_.end())
    return std::nullopt;
  return it->second;
}

bool BlobBackend::remove(const std::string &id, std::string *err) {
  if (!ready_) {
    if (err)
      *err = "blob store not initialized";
    return false;
  }
  const std::string path = file_path(id);
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    if (err)
      *err = errno_text("unlink", path);
    return false;
  }
  index_.erase(id);
  if (cfg_.fsync == FsyncMode::Always)
    fsync_dir(models_dir());
  return true;
}

bool BlobBackend::touch(const std::string &id, TimePoint at,
                        std::string *err) {
  auto e = get(id, err);
  if (!e.has_value())
    return false;
  e->meta.last_accessed = at;
  return put(*e, err);
}

bool BlobBackend::list_all(std::vector<ModelMeta> *out, std::string *err) {
  out->clear();
  if (!ready_) {
    if (err)
      *err = "blob store not initialized";
    return false;
  }
  out->reserve(index_.size());
  for (const auto &[_, m] : index_)
    out->push_back(m);
  return true;
}

std::string BlobBackend::models_dir() const { return cfg_.dir + "/models"; }

std::string BlobBackend::file_path(const std::string &id) const {
  return models_dir() + "/" + encode_file_name(id);
}

bool BlobBackend::write_record(const std::string &path,
                               const std::string &header,
                               const std::vector<std::uint8_t> &payload,
                               std::string *err) {
  BlobHeader h{};
  h.magic = kMagic;
  h.meta_len = static_cast<std::uint32_t>(header.size());
  h.payload_len = static_cast<std::uint64_t>(payload.size());
  h.checksum = header_checksum(h, header);

  // Encoded names never start with '.', so temp files cannot shadow an entry.
  const std::filesystem::path final_path(path);
  const std::string tmp = (final_path.parent_path() /
                           ("." + final_path.filename().string() + kTmpSuffix))
                              .string();
  int fd = open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
  if (fd < 0) {
    if (err)
      *err = errno_text("open", tmp);
    return false;
  }
  bool ok = write_all(fd, &h, sizeof(h)) &&
            write_all(fd, header.data(), header.size()) &&
            (payload.empty() || write_all(fd, payload.data(), payload.size()));
  if (ok && cfg_.fsync == FsyncMode::Always)
    ok = ::fsync(fd) == 0;
  if (!ok && err)
    *err = errno_text("write", tmp);
  close(fd);
  if (!ok) {
    ::unlink(tmp.c_str());
    return false;
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    if (err)
      *err = errno_text("rename", tmp);
    ::unlink(tmp.c_str());
    return false;
  }
  if (cfg_.fsync == FsyncMode::Always && !fsync_dir(models_dir())) {
    if (err)
      *err = errno_text("fsync", models_dir());
    return false;
  }
  stats_.write_mb += static_cast<double>(sizeof(h) + header.size() +
                                         payload.size()) /
                     (1024.0 * 1024.0);
  return true;
}

// Returns false with *err untouched when the record is missing or torn, and
// false with *err set on an I/O error.
bool BlobBackend::read_record(const std::string &path, ModelMeta *meta,
                              std::vector<std::uint8_t> *payload,
                              std::string *err) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    if (errno != ENOENT && err)
      *err = errno_text("open", path);
    return false;
  }
  struct stat st {};
  if (fstat(fd, &st) != 0) {
    if (err)
      *err = errno_text("fstat", path);
    close(fd);
    return false;
  }
  BlobHeader h{};
  const auto file_size = static_cast<std::uint64_t>(st.st_size);
  if (file_size < sizeof(h) || !pread_all(fd, &h, sizeof(h), 0) ||
      h.magic != kMagic || h.meta_len > kMaxMetaLen ||
      file_size != sizeof(h) + h.meta_len + h.payload_len) {
    close(fd);
    return false;
  }
  std::string header(h.meta_len, '\0');
  if (h.meta_len > 0 &&
      !pread_all(fd, header.data(), h.meta_len, static_cast<off_t>(sizeof(h)))) {
    close(fd);
    return false;
  }
  if (header_checksum(h, header) != h.checksum ||
      !parse_meta_header(header, meta) || meta->size_bytes != h.payload_len) {
    close(fd);
    return false;
  }
  if (payload) {
    payload->assign(h.payload_len, 0);
    if (h.payload_len > 0 &&
        !pread_all(fd, payload->data(), h.payload_len,
                   static_cast<off_t>(sizeof(h) + h.meta_len))) {
      if (err)
        *err = errno_text("read", path);
      close(fd);
      return false;
    }
    stats_.read_mb += static_cast<double>(h.payload_len + h.meta_len +
                                          sizeof(h)) /
                      (1024.0 * 1024.0);
  }
  close(fd);
  return true;
}

bool BlobBackend::scan_models_dir(std::string *err) {
  std::error_code ec;
  std::filesystem::directory_iterator it(models_dir(), ec), end;
  if (ec) {
    if (err)
      *err = "cannot scan " + models_dir() + ": " + ec.message();
    return false;
  }
  std::vector<std::filesystem::path> drop;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      if (err)
        *err = "scan " + models_dir() + ": " + ec.message();
      return false;
    }
    const auto &p = it->path();
    if (!it->is_regular_file(ec))
      continue;
    if (p.filename().string().front() == '.') {
      drop.push_back(p);
      continue;
    }
    ModelMeta meta;
    std::string read_err;
    if (!read_record(p.string(), &meta, nullptr, &read_err)) {
      if (!read_err.empty()) {
        if (err)
          *err = read_err;
        return false;
      }
      drop.push_back(p);
      continue;
    }
    if (p.filename().string() != encode_file_name(meta.id)) {
      drop.push_back(p);
      continue;
    }
    index_[meta.id] = meta;
  }
  for (const auto &p : drop) {
    std::filesystem::remove(p, ec);
    ++stats_.torn_records_dropped;
  }
  return true;
}

} // namespace model_cache
