#ifndef VECTOR3_H
#define VECTOR3_H

#include <cmath>

/**
 * Three-component vector used for TEME/ECEF positions (km) and for the
 * Sense HAT body-frame axes (accelerometer g, gyroscope rad/s, compass uT).
 */
class Vector3 {
private:
    double x, y, z;

public:
    Vector3(double x = 0.0, double y = 0.0, double z = 0.0);

    double getX() const { return x; }
    double getY() const { return y; }
    double getZ() const { return z; }

    Vector3 operator+(const Vector3& other) const;
    Vector3 operator-(const Vector3& other) const;
    Vector3 operator-() const;
    Vector3 operator*(double scalar) const;
    Vector3 operator/(double scalar) const;

    double dot(const Vector3& other) const;
    Vector3 cross(const Vector3& other) const;
    double magnitude() const;
    Vector3 normalized() const;

    // Right-handed rotation of the frame about +Z (ECI -> ECEF uses +GMST)
    Vector3 rotatedAboutZ(double angle_radians) const;
};

#endif
