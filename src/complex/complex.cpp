#include <cmath>
#include <complex>
#include <stdexcept>

#include "complex.hpp"

namespace {
    std::complex<long double> toStd(const Complex& z) {
        return std::complex<long double>(z.real(), z.imag());
    }

    Complex fromStd(const std::complex<long double>& z) {
        return Complex(z.real(), z.imag());
    }
}

// Constructors
Complex::Complex() : re(0.0), im(0.0) {}
Complex::Complex(const long double& value) : re(value), im(0.0) {}
Complex::Complex(const long double& real, const long double& imag) : re(real), im(imag) {}

// Getters
long double Complex::real() const { return re; }
long double Complex::imag() const { return im; }

// Complex arithmetic operators
Complex Complex::operator+(const Complex& w) const {
    return Complex(re + w.re, im + w.im);
}

Complex Complex::operator-(const Complex& w) const {
    return Complex(re - w.re, im - w.im);
}

Complex Complex::operator*(const Complex& w) const {
    return Complex(re * w.re - im * w.im, re * w.im + im * w.re);
}

Complex Complex::operator/(const Complex& w) const {
    long double denom = w.re * w.re + w.im * w.im;
    return Complex((re * w.re + im * w.im) / denom, (im * w.re - re * w.im) / denom);
}

Complex Complex::operator-() const {
    return Complex(-re, -im);
}

// Comparison operators
bool Complex::operator==(const Complex& w) const { return re == w.re && im == w.im; }
bool Complex::operator!=(const Complex& w) const { return !(*this == w); }

// Scalar arithmetic operators
Complex Complex::operator*(long double scalar) const { return Complex(re * scalar, im * scalar); }
Complex Complex::operator/(long double scalar) const { return Complex(re / scalar, im / scalar); }

// Elementary operations
Complex Complex::conj(const Complex& z) {
    return Complex(z.real(), -z.imag());
}

Complex Complex::reciprocal(const Complex& z) {
    long double denom = magSq(z);
    if (denom == 0.0)
        throw std::domain_error("reciprocal of zero");

    return Complex(z.real() / denom, -z.imag() / denom);
}

long double Complex::mag(const Complex& z) {
    return sqrtl(z.real() * z.real() + z.imag() * z.imag());
}

long double Complex::magSq(const Complex& z) {
    return z.real() * z.real() + z.imag() * z.imag();
}

long double Complex::phase(const Complex& z) {
    return atan2l(z.imag(), z.real());
}

// Trigonometric and hyperbolic functions
Complex Complex::acos(const Complex& z) { return fromStd(std::acos(toStd(z))); }
Complex Complex::asin(const Complex& z) { return fromStd(std::asin(toStd(z))); }
Complex Complex::atan(const Complex& z) { return fromStd(std::atan(toStd(z))); }
Complex Complex::cos(const Complex& z) { return fromStd(std::cos(toStd(z))); }
Complex Complex::cosh(const Complex& z) { return fromStd(std::cosh(toStd(z))); }
Complex Complex::sin(const Complex& z) { return fromStd(std::sin(toStd(z))); }
Complex Complex::sinh(const Complex& z) { return fromStd(std::sinh(toStd(z))); }
Complex Complex::tan(const Complex& z) { return fromStd(std::tan(toStd(z))); }
Complex Complex::tanh(const Complex& z) { return fromStd(std::tanh(toStd(z))); }

// Exponential and logarithmic functions
Complex Complex::exp(const Complex& z) { return fromStd(std::exp(toStd(z))); }
Complex Complex::log(const Complex& z) { return fromStd(std::log(toStd(z))); }
Complex Complex::log10(const Complex& z) { return fromStd(std::log10(toStd(z))); }
Complex Complex::sqrt(const Complex& z) { return fromStd(std::sqrt(toStd(z))); }

Complex Complex::log(const Complex& z, const Complex& base) {
    if (magSq(base) == 0.0)
        throw std::domain_error("logarithm base must be nonzero");

    // log_b(z) = ln(z) / ln(b)
    Complex lnBase = log(base);
    if (magSq(lnBase) == 0.0)
        throw std::domain_error("logarithm base must not be 1");

    // Real divisor keeps ln(0) = (-inf, 0) free of NaN
    if (lnBase.imag() == 0.0)
        return log(z) / lnBase.real();

    return log(z) / lnBase;
}

Complex Complex::pow(const Complex& z, const Complex& w) {
    if (magSq(w) == 0.0)
        return Complex(1.0);
    if (magSq(z) == 0.0)
        return Complex();

    return fromStd(std::pow(toStd(z), toStd(w)));
}
