// minilang/basic/source_manager.hpp - Source location and range management
//
// Byte-offset locations carried by AST nodes, plus the SourceFile that turns
// them into line/column positions when the parser supplied the source text.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace minilang
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset into the source text. Line and column are computed on
 * demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}

  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * Half-open byte range [start, end) in the source text.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - start_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions
// ============================================================================

/// 1-indexed line and column (0 = invalid)
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile - Path, text and line table
// ============================================================================

/**
 * Source text of one program as supplied by the external parser.
 *
 * The analyzer never needs it; diagnostics use it to print line/column
 * positions and the offending source line.
 */
class SourceFile
{
public:
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & get_path() const noexcept { return path_; }
  [[nodiscard]] std::string_view get_content() const noexcept { return content_; }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed). Offsets past the end clamp.
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line (0-indexed), without its line terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Text covered by a range (clamped to the content)
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace minilang
