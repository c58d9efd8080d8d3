#include "ballsim/math/vector_math.hpp"

#include <cmath>

bool isFinite(double value) {
  return std::isfinite(value);
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::operator Vector() const {
  return {this->x, this->y};
}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y};
}

Vector Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

Position Position::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

bool Position::operator==(const Position& p) const {
  return this->x == p.x && this->y == p.y;
}

bool Position::operator!=(const Position& p) const {
  return !(*this == p);
}

double Position::dist(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return std::sqrt(dx * dx + dy * dy);
}

Position& Position::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Position& Position::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

Vector::operator Position() const {
  return {this->x, this->y};
}

Vector Vector::operator-() const {
  return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

double Vector::length() const {
  return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > 0.0) {
    return {this->x / len, this->y / len};
  }
  return *this;
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Vector& Vector::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}
