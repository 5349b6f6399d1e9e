#pragma once

namespace lineplan::core {

// Floor frame: x runs along the line, y is height, z is the across-line (lane) offset.
struct Vec3d {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

inline Vec3d operator+(const Vec3d& a, const Vec3d& b) {
  return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3d operator-(const Vec3d& a, const Vec3d& b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}

inline bool operator==(const Vec3d& a, const Vec3d& b) {
  return a.x == b.x && a.y == b.y && a.z == b.z;
}

struct Transformd {
  Vec3d position{};
  // Only y (yaw) is ever non-zero for placed entities.
  Vec3d rotation_euler_deg{};
};

struct AABBd {
  Vec3d min{};
  Vec3d max{};
};

// Floor footprint in metres. length runs along the line.
struct Footprint {
  double length_m = 0.0;
  double width_m = 0.0;
};

}  // namespace lineplan::core
