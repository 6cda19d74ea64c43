#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>

namespace jr {

// Seekable byte stream consumed by the line readers.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Absolute seek. False on failure, errno in last_error().
  virtual bool seek(std::uint64_t offset) = 0;

  // Reads up to n bytes at the cursor. Returns bytes read, 0 at end, -1 on error.
  virtual std::int64_t read(char* dst, std::size_t n) = 0;

  // Total length through a seek-to-end probe. False if the source cannot seek.
  virtual bool size(std::uint64_t& out) = 0;

  virtual int last_error() const noexcept = 0;
};

class FileSource : public ByteSource {
public:
  // Opens `path` read-only; returns null and the errno in *err_out on failure.
  static std::unique_ptr<FileSource> open(const std::string& path, int* err_out = nullptr);

  // Wraps an already open stream (e.g. stdin). Closes it on destruction if `owns`.
  static std::unique_ptr<FileSource> adopt(std::FILE* f, bool owns);

  ~FileSource() override;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  bool seek(std::uint64_t offset) override;
  std::int64_t read(char* dst, std::size_t n) override;
  bool size(std::uint64_t& out) override;
  int last_error() const noexcept override { return last_errno_; }

private:
  FileSource(std::FILE* f, bool owns) : f_(f), owns_(owns) {}

  std::FILE* f_{nullptr};
  bool owns_{true};
  int last_errno_{0};
};

class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::string bytes) : data_(std::move(bytes)) {}

  bool seek(std::uint64_t offset) override;
  std::int64_t read(char* dst, std::size_t n) override;
  bool size(std::uint64_t& out) override;
  int last_error() const noexcept override { return last_errno_; }

  const std::string& data() const noexcept { return data_; }

private:
  std::string data_;
  std::size_t cursor_{0};
  int last_errno_{0};
};

}
