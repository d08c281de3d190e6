#ifndef COMPLEX_H
#define COMPLEX_H

class Complex {
    private:
        long double re;
        long double im;

    public:
        // Constructors
        Complex();
        Complex(const long double& value);
        Complex(const long double& real, const long double& imag);

        // Getters
        long double real() const;
        long double imag() const;

        // Complex arithmetic operators
        Complex operator+(const Complex& w) const;
        Complex operator-(const Complex& w) const;
        Complex operator*(const Complex& w) const;
        Complex operator/(const Complex& w) const;
        Complex operator-() const;

        // Comparison operators
        bool operator==(const Complex& w) const;
        bool operator!=(const Complex& w) const;

        // Scalar arithmetic operators
        Complex operator*(long double scalar) const;
        Complex operator/(long double scalar) const;

        // Elementary operations
        static Complex conj(const Complex& z);
        static Complex reciprocal(const Complex& z);
        static long double mag(const Complex& z);
        static long double magSq(const Complex& z);
        static long double phase(const Complex& z);

        // Trigonometric and hyperbolic functions
        static Complex acos(const Complex& z);
        static Complex asin(const Complex& z);
        static Complex atan(const Complex& z);
        static Complex cos(const Complex& z);
        static Complex cosh(const Complex& z);
        static Complex sin(const Complex& z);
        static Complex sinh(const Complex& z);
        static Complex tan(const Complex& z);
        static Complex tanh(const Complex& z);

        // Exponential and logarithmic functions
        static Complex exp(const Complex& z);
        static Complex log(const Complex& z);
        static Complex log(const Complex& z, const Complex& base);
        static Complex log10(const Complex& z);
        static Complex sqrt(const Complex& z);
        static Complex pow(const Complex& z, const Complex& w);
};

#endif
