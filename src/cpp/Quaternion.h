#ifndef QUATERNION_H
#define QUATERNION_H

#include <cmath>
#include "Vector3.h"

// Roll (X), pitch (Y), yaw (Z) in radians, aerospace Z-Y-X sequence
struct EulerAngles {
	double roll = 0.0;
	double pitch = 0.0;
	double yaw = 0.0;
};

class Quaternion {
private:
	double w, x, y, z; //w - scalar part, (x, y, z) - vector part

public:
	Quaternion(double w = 1.0, double x = 0.0, double y = 0.0, double z = 0.0);
	//Create from axis-angle rotation
	Quaternion(const Vector3& axis, double angle_radians);
	static Quaternion fromEuler(const EulerAngles& angles);

	double getW() const { return w; }
	double getX() const { return x; }
	double getY() const { return y; }
	double getZ() const { return z; }

	Quaternion operator*(const Quaternion& other) const; //Hamilton product
	Quaternion conjugate() const;
	double dot(const Quaternion& other) const;
	double norm() const;
	Quaternion normalized() const;

	Vector3 rotate(const Vector3& vector) const;
	EulerAngles toEuler() const;

	//Propagate body-frame attitude by an angular rate held for dt seconds
	Quaternion integrated(const Vector3& body_rate, double dt) const;

	//Normalised linear blend toward target, shortest path. 0 keeps this, 1 gives target
	Quaternion blendedToward(const Quaternion& target, double weight) const;
};

#endif
