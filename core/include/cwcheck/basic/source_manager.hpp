// cwcheck/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking source code locations and ranges
// across the files of a workspace.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cwcheck
{

namespace fs = std::filesystem;

// ============================================================================
// FileId - Compact file handle
// ============================================================================

struct FileId
{
  static constexpr uint32_t k_invalid = UINT32_MAX;

  uint32_t value = k_invalid;

  constexpr FileId() noexcept = default;
  constexpr explicit FileId(uint32_t v) noexcept : value(v) {}

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(const FileId & other) const noexcept = default;
};

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A file-qualified byte offset.
 *
 * Line and column information is computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(const SourceLocation & other) const noexcept = default;
  [[nodiscard]] constexpr bool operator<(const SourceLocation & other) const noexcept
  {
    if (file_.value != other.file_.value) {
      return file_.value < other.file_.value;
    }
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A half-open byte range [begin, end) within one file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : file_(file), begin_(begin), end_(end)
  {
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return {file_, begin_}; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return {file_, end_}; }
  [[nodiscard]] constexpr uint32_t begin_offset() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t end_offset() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && begin_ != SourceLocation::k_invalid_offset &&
           end_ != SourceLocation::k_invalid_offset && begin_ <= end_;
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return loc.file_id() == file_ && loc.offset() >= begin_ && loc.offset() < end_;
  }

  /// Inclusive at both ends; used for cursor queries where the cursor may sit
  /// just after the last character of a word.
  [[nodiscard]] constexpr bool touches(uint32_t offset) const noexcept
  {
    return offset >= begin_ && offset <= end_;
  }

  [[nodiscard]] constexpr bool contains(const SourceRange & other) const noexcept
  {
    return other.file_ == file_ && other.begin_ >= begin_ && other.end_ <= end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_ - begin_ : 0;
  }

  [[nodiscard]] constexpr bool operator==(const SourceRange & other) const noexcept = default;

private:
  FileId file_;
  uint32_t begin_ = SourceLocation::k_invalid_offset;
  uint32_t end_ = SourceLocation::k_invalid_offset;
};

/// Smallest range covering both inputs. Ranges must belong to the same file.
[[nodiscard]] constexpr SourceRange join_ranges(const SourceRange & a, const SourceRange & b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  const uint32_t begin = a.begin_offset() < b.begin_offset() ? a.begin_offset() : b.begin_offset();
  const uint32_t end = a.end_offset() > b.end_offset() ? a.end_offset() : b.end_offset();
  return {a.file_id(), begin, end};
}

// ============================================================================
// LineColumn / FullSourceRange
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Source range with pre-computed line/column information.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * One source buffer together with its line table.
 *
 * SourceFile instances are immutable once published; an edit produces a new
 * instance so that readers holding the old one stay consistent.
 */
class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a 0-indexed line, without the trailing newline.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry - FileId <-> SourceFile mapping
// ============================================================================

class SourceRegistry
{
public:
  SourceRegistry() = default;

  /// Register a file, or return the existing id when the path is known.
  /// The content of an already-known path is left untouched.
  FileId register_file(fs::path path, std::string content);

  /// Replace the content of a registered file with a fresh SourceFile.
  void update_content(FileId id, std::string new_content);

  /// Forget the content of a file. The id stays reserved for its path.
  void release(FileId id);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] std::shared_ptr<const SourceFile> share_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_path(const fs::path & path) const;

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  static std::string normalize_key(const fs::path & path);

  std::vector<std::shared_ptr<const SourceFile>> files_;
  std::vector<fs::path> paths_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace cwcheck
