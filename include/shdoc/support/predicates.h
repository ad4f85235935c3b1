/***
 * Name: shdoc::support (predicates)
 * Purpose: Stateless boolean checks on strings, integers, paths, and file attributes.
 * Inputs: Strings, integers, or filesystem paths
 * Outputs: true/false; never throw
 * Theory of Operation: String and integer checks are pure. Path checks inspect
 *   the filesystem through std::filesystem (error_code overloads) and access(2)
 *   for permission bits; any error reads as false.
 */
#pragma once

#include <string>
#include <string_view>

namespace shdoc {
namespace support {

// Strings
bool IsEmpty(std::string_view str);
bool IsNotEmpty(std::string_view str);
bool IsEqual(std::string_view lhs, std::string_view rhs);
bool IsNotEqual(std::string_view lhs, std::string_view rhs);
bool StartsWith(std::string_view str, std::string_view prefix);
bool EndsWith(std::string_view str, std::string_view suffix);
bool ContainsSubstring(std::string_view str, std::string_view sub);
bool IsEmptyOrWhitespace(std::string_view str);

// Integers
/*** IsInteger: optional leading '-', then one or more digits. */
bool IsInteger(std::string_view str);
/*** IsPositiveInteger: digits only and greater than zero. */
bool IsPositiveInteger(std::string_view str);
/*** IsBetween: low <= value <= high. */
bool IsBetween(long long value, long long low, long long high);
bool IsOdd(long long value);
bool IsEven(long long value);

// Paths
bool IsAbsolutePath(std::string_view path);
bool IsRelativePath(std::string_view path);

// File attributes
bool FileExists(const std::string& path);
bool IsFile(const std::string& path);
bool IsDir(const std::string& path);
bool IsSymlink(const std::string& path);
bool IsReadable(const std::string& path);
bool IsWritable(const std::string& path);
bool IsExecutable(const std::string& path);
bool FileNotEmpty(const std::string& path);
bool IsReadableFile(const std::string& path);
bool IsWritableDir(const std::string& path);
bool FileIsExecutable(const std::string& path);

}  // namespace support
}  // namespace shdoc
