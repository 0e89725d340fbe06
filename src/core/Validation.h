// src/core/Validation.h
//
// Input validation and display formatting helpers.

#pragma once

#include <QString>

namespace mdi {

/// Loose `local@domain.tld` check performed before any login round trip.
[[nodiscard]] bool isValidEmail(const QString& email);

/// Empty when `name` is an acceptable layer name, otherwise the reason.
[[nodiscard]] QString validateLayerName(const QString& name);

/// Replaces characters that are invalid in file/layer names with '_' and
/// collapses whitespace.
[[nodiscard]] QString sanitizeFileName(const QString& name);

/// "hole_id" -> "Hole Id", "max_depth_m" -> "Max Depth M".
[[nodiscard]] QString formatColumnName(const QString& column);

} // namespace mdi
