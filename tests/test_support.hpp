/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 DimitryQm
 * This file is part of heapline (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */

#ifndef HEAPLINE_TEST_SUPPORT_HPP_INCLUDED
#define HEAPLINE_TEST_SUPPORT_HPP_INCLUDED

#include "heapline.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

// Empty scratch directory under the build tree, one per test.
inline std::string fresh_dir(const std::string& name) {
  const std::string dir = "heapline-test-" + name;
  std::vector<std::string> names;
  if (heapline::list_dir(dir, names))
    for (const std::string& n : names) std::remove(heapline::join_path(dir, n).c_str());
  bool ok = heapline::make_dirs(dir.c_str());
  assert(ok);
  (void)ok;
  return dir;
}

// Fake addresses: the recorder never dereferences them.
inline const void* fake_ptr(uint64_t v) { return reinterpret_cast<const void*>((uintptr_t)v); }

inline bool contains(const std::string& hay, const std::string& needle) { return hay.find(needle) != std::string::npos; }

inline size_t count_containing(const std::vector<std::string>& v, const std::string& needle) {
  size_t n = 0;
  for (const std::string& s : v) if (contains(s, needle)) ++n;
  return n;
}

#endif // HEAPLINE_TEST_SUPPORT_HPP_INCLUDED
