/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_CONFIG_HPP_INCLUDED
#define HEAPLINE_CONFIG_HPP_INCLUDED

#include "base.hpp"
#include "log.hpp"

namespace heapline {

enum class AdvancedMetricsLevel : uint8_t { None, Essential, Comprehensive };

inline const char* metrics_level_name(AdvancedMetricsLevel l) {
  switch (l) {
    case AdvancedMetricsLevel::None:          return "none";
    case AdvancedMetricsLevel::Essential:     return "essential";
    case AdvancedMetricsLevel::Comprehensive: return "comprehensive";
  }
  return "?";
}

// One bit per optional analysis section; stored in file metadata.
enum SectionFlag : uint32_t {
  SECTION_THREAD_CONTEXT = 1u << 0,
  SECTION_GROWTH         = 1u << 1,
  SECTION_SOURCE         = 1u << 2,
  SECTION_FRAGMENTATION  = 1u << 3,
  SECTION_LIFETIMES      = 1u << 4,
  SECTION_HEALTH         = 1u << 5,
};

constexpr uint32_t MIN_BUFFER_SIZE = 1024;
constexpr uint32_t MAX_BUFFER_SIZE = 1024 * 1024;
constexpr int      MAX_COMPRESSION_LEVEL = 9;

struct BinaryExportConfig {
  uint32_t             buffer_size = 64 * 1024;
  int                  compression_level = 0;
  AdvancedMetricsLevel advanced_metrics_level = AdvancedMetricsLevel::Essential;

  bool source_analysis = false;
  bool container_analysis = true;
  bool fragmentation_analysis = false;
  bool thread_context_tracking = true;
  bool drop_chain_analysis = false;
  bool health_scoring = false;

  // Cheap sections only, no compression. The default.
  static BinaryExportConfig performance_first() { return BinaryExportConfig{}; }

  static BinaryExportConfig debug_comprehensive() {
    BinaryExportConfig c;
    c.buffer_size = 128 * 1024;
    c.compression_level = 1;
    c.advanced_metrics_level = AdvancedMetricsLevel::Comprehensive;
    c.source_analysis = true;
    c.container_analysis = true;
    c.fragmentation_analysis = true;
    c.thread_context_tracking = true;
    c.drop_chain_analysis = true;
    c.health_scoring = true;
    return c;
  }

  static BinaryExportConfig minimal() {
    BinaryExportConfig c;
    c.buffer_size = 32 * 1024;
    c.advanced_metrics_level = AdvancedMetricsLevel::None;
    c.container_analysis = false;
    c.thread_context_tracking = false;
    return c;
  }

  bool any_section() const {
    return source_analysis || container_analysis || fragmentation_analysis ||
           thread_context_tracking || drop_chain_analysis || health_scoring;
  }

  uint32_t section_flags() const {
    uint32_t f = 0;
    if (thread_context_tracking) f |= SECTION_THREAD_CONTEXT;
    if (container_analysis)      f |= SECTION_GROWTH;
    if (source_analysis)         f |= SECTION_SOURCE;
    if (fragmentation_analysis)  f |= SECTION_FRAGMENTATION;
    if (drop_chain_analysis)     f |= SECTION_LIFETIMES;
    if (health_scoring)          f |= SECTION_HEALTH;
    return f;
  }
};

// Brings `c` into a consistent state and returns one message per correction made.
// Every message is also logged at Warning level.
inline std::vector<std::string> validate_and_fix(BinaryExportConfig& c) {
  std::vector<std::string> w;
  char msg[256];

  if (c.buffer_size < MIN_BUFFER_SIZE || c.buffer_size > MAX_BUFFER_SIZE) {
    uint32_t fixed = c.buffer_size < MIN_BUFFER_SIZE ? MIN_BUFFER_SIZE : MAX_BUFFER_SIZE;
    std::snprintf(msg, sizeof(msg), "buffer_size %u out of range, clamped to %u", c.buffer_size, fixed);
    w.emplace_back(msg);
    c.buffer_size = fixed;
  }
  if (c.compression_level < 0 || c.compression_level > MAX_COMPRESSION_LEVEL) {
    int fixed = c.compression_level < 0 ? 0 : MAX_COMPRESSION_LEVEL;
    std::snprintf(msg, sizeof(msg), "compression_level %d out of range, clamped to %d", c.compression_level, fixed);
    w.emplace_back(msg);
    c.compression_level = fixed;
  }

  switch (c.advanced_metrics_level) {
    case AdvancedMetricsLevel::None:
      if (c.any_section()) {
        c.source_analysis = c.container_analysis = c.fragmentation_analysis = false;
        c.thread_context_tracking = c.drop_chain_analysis = c.health_scoring = false;
        w.emplace_back("advanced_metrics_level is none, all analysis sections disabled");
      }
      break;
    case AdvancedMetricsLevel::Essential: {
      struct { bool* flag; const char* name; } expensive[] = {
        { &c.source_analysis,        "source_analysis" },
        { &c.fragmentation_analysis, "fragmentation_analysis" },
        { &c.drop_chain_analysis,    "drop_chain_analysis" },
        { &c.health_scoring,         "health_scoring" },
      };
      for (auto& e : expensive) {
        if (!*e.flag) continue;
        *e.flag = false;
        std::snprintf(msg, sizeof(msg), "%s requires comprehensive metrics, disabled at essential level", e.name);
        w.emplace_back(msg);
      }
      break;
    }
    case AdvancedMetricsLevel::Comprehensive:
      if (c.compression_level > 0)
        w.emplace_back("comprehensive metrics with compression enabled will slow down export");
      break;
  }

  for (const std::string& s : w) HEAPLINE_LOG_WARN("export config: %s", s.c_str());
  return w;
}

} // namespace heapline

#endif // HEAPLINE_CONFIG_HPP_INCLUDED
