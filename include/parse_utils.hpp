#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB, GB, TB, or PB (case-insensitive).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a boolean setting.
// Format: true/false, yes/no, on/off, 1/0 (case-insensitive, surrounding blanks ignored).
// Invalid input: anything else sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
