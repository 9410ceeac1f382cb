// Repository: BellWatch
// Component: Identifier Generation
// Copyright (c) 2026 BellWatch

#include "bellwatch/util/Uuid.hpp"

#include <random>

namespace bellwatch::util {

std::string GenerateUuidV4() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<int> dis(0, 15);
  const char* hexdig = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
    if (i == 12) out += '4';
    else if (i == 16) out += hexdig[8 + dis(gen) % 4];
    else out += hexdig[dis(gen)];
  }
  return out;
}

}  // namespace bellwatch::util
