#include "test_utils.hpp" // Include common test utilities
#include <boost/multiprecision/cpp_bin_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/rational.hpp>
#include <cmath>
#include <complex>
#include <limits>
#include <string>
#include <gtest/gtest.h>

using namespace powser;

TEST(ScalarTraitsTest, TypeDetection) {
    EXPECT_TRUE(is_complex<std::complex<double>>::value);
    EXPECT_FALSE(is_complex<double>::value);
    EXPECT_TRUE(is_boost_rational<boost::rational<long long>>::value);
    EXPECT_FALSE(is_boost_rational<Rational>::value);
    EXPECT_TRUE((is_multiprecision_kind<Rational, boost::multiprecision::number_kind_rational>::value));
    EXPECT_FALSE((is_multiprecision_kind<double, boost::multiprecision::number_kind_rational>::value));
    EXPECT_TRUE((is_multiprecision_kind<boost::multiprecision::cpp_bin_float_50,
                                        boost::multiprecision::number_kind_floating_point>::value));
}

TEST(ScalarTraitsTest, ExactZero) {
    EXPECT_TRUE(is_zero(0.0));
    EXPECT_TRUE(is_zero(-0.0));
    EXPECT_FALSE(is_zero(1e-300));
    EXPECT_TRUE(is_zero(q(0)));
    EXPECT_FALSE(is_zero(q(1, 1000000)));
    EXPECT_TRUE(is_zero(std::complex<double>(0.0, 0.0)));
    EXPECT_FALSE(is_zero(std::complex<double>(0.0, 1.0)));
}

TEST(ScalarTraitsTest, FromIndex) {
    EXPECT_EQ(from_index<Rational>(7), q(7));
    EXPECT_DOUBLE_EQ(from_index<double>(12), 12.0);
    EXPECT_EQ(from_index<std::complex<double>>(3), std::complex<double>(3.0, 0.0));
}

TEST(ScalarTraitsTest, CheckedDivide) {
    EXPECT_EQ(checked_divide(q(1), q(3), "test"), q(1, 3));
    EXPECT_DOUBLE_EQ(checked_divide(1.0, 4.0, "test"), 0.25);
    EXPECT_THROW(static_cast<void>(checked_divide(q(1), q(0), "test")), DivisionByZero);
    EXPECT_THROW(static_cast<void>(checked_divide(1.0, 0.0, "test")), DivisionByZero);

    try {
        static_cast<void>(checked_divide(2.0, 0.0, "scale_down"));
        FAIL() << "Expected DivisionByZero";
    } catch (const DivisionByZero &e) {
        EXPECT_NE(std::string(e.what()).find("[scale_down]"), std::string::npos);
    }
}

TEST(ScalarTraitsTest, ExactIntegerSqrt) {
    long long root = 0;
    EXPECT_TRUE(exact_integer_sqrt(0LL, root));
    EXPECT_EQ(root, 0);
    EXPECT_TRUE(exact_integer_sqrt(1LL, root));
    EXPECT_EQ(root, 1);
    EXPECT_TRUE(exact_integer_sqrt(144LL, root));
    EXPECT_EQ(root, 12);
    EXPECT_FALSE(exact_integer_sqrt(2LL, root));
    EXPECT_FALSE(exact_integer_sqrt(143LL, root));
    EXPECT_FALSE(exact_integer_sqrt(-4LL, root));

    // Near the top of a fixed-width type
    int small_root = 0;
    EXPECT_FALSE(exact_integer_sqrt(std::numeric_limits<int>::max(), small_root));
    EXPECT_TRUE(exact_integer_sqrt(46340 * 46340, small_root));
    EXPECT_EQ(small_root, 46340);
    EXPECT_FALSE(exact_integer_sqrt(46340 * 46340 + 1, small_root));
    long long wide_root = 0;
    EXPECT_FALSE(exact_integer_sqrt(std::numeric_limits<long long>::max(), wide_root));
    EXPECT_TRUE(exact_integer_sqrt(3037000499LL * 3037000499LL, wide_root));
    EXPECT_EQ(wide_root, 3037000499LL);

    // Beyond 64 bits
    using boost::multiprecision::cpp_int;
    cpp_int const big = cpp_int(1) << 100;
    cpp_int big_root;
    EXPECT_TRUE(exact_integer_sqrt(cpp_int(big * big), big_root));
    EXPECT_EQ(big_root, big);
    EXPECT_FALSE(exact_integer_sqrt(cpp_int(big * big + 1), big_root));
}

TEST(ScalarTraitsTest, PrincipalSqrtReal) {
    EXPECT_DOUBLE_EQ(principal_sqrt(9.0, "test"), 3.0);
    EXPECT_DOUBLE_EQ(principal_sqrt(2.0, "test"), std::sqrt(2.0));
    EXPECT_THROW(static_cast<void>(principal_sqrt(-1.0, "test")), NoPrincipalRoot);

    using boost::multiprecision::cpp_bin_float_50;
    cpp_bin_float_50 const root = principal_sqrt(cpp_bin_float_50(2), "test");
    cpp_bin_float_50 const error = boost::multiprecision::abs(cpp_bin_float_50(root * root - 2));
    EXPECT_LT(error, cpp_bin_float_50(1e-45));
    EXPECT_THROW(static_cast<void>(principal_sqrt(cpp_bin_float_50(-2), "test")), NoPrincipalRoot);
}

TEST(ScalarTraitsTest, PrincipalSqrtComplex) {
    using Complex = std::complex<double>;
    Complex const root = principal_sqrt(Complex(-9.0, 0.0), "test");
    EXPECT_NEAR(root.real(), 0.0, 1e-15);
    EXPECT_NEAR(root.imag(), 3.0, 1e-15);

    Complex const i_root = principal_sqrt(Complex(0.0, 2.0), "test"); // 1 + i
    EXPECT_NEAR(i_root.real(), 1.0, 1e-15);
    EXPECT_NEAR(i_root.imag(), 1.0, 1e-15);
}

TEST(ScalarTraitsTest, PrincipalSqrtRational) {
    EXPECT_EQ(principal_sqrt(q(16, 25), "test"), q(4, 5));
    EXPECT_EQ(principal_sqrt(q(1), "test"), q(1));
    EXPECT_THROW(static_cast<void>(principal_sqrt(q(2), "test")), NoPrincipalRoot);
    EXPECT_THROW(static_cast<void>(principal_sqrt(q(1, 3), "test")), NoPrincipalRoot);
    EXPECT_THROW(static_cast<void>(principal_sqrt(q(-4), "test")), NoPrincipalRoot);

    using Fraction = boost::rational<long long>;
    EXPECT_EQ(principal_sqrt(Fraction(9, 4), "test"), Fraction(3, 2));
    EXPECT_THROW(static_cast<void>(principal_sqrt(Fraction(8, 9), "test")), NoPrincipalRoot);
}

TEST(ScalarTraitsTest, BoostRationalSeries) {
    // The engine runs unchanged over boost::rational
    using Fraction = boost::rational<long long>;
    Series<Fraction> const e = functions::exp_series<Fraction>();
    EXPECT_SERIES_EQ(e, std::vector<Fraction>{ Fraction(1), Fraction(1), Fraction(1, 2), Fraction(1, 6),
                                               Fraction(1, 24) });
    Series<Fraction> const root = sqrt(Series<Fraction>{ Fraction(1), Fraction(1) });
    EXPECT_SERIES_EQ(root, std::vector<Fraction>{ Fraction(1), Fraction(1, 2), Fraction(-1, 8), Fraction(1, 16) });
}

TEST(ScalarTraitsTest, SqrtOfLargestIntRationalHasNoRoot) {
    using SmallFraction = boost::rational<int>;
    Series<SmallFraction> const f{ SmallFraction(std::numeric_limits<int>::max()) };
    EXPECT_THROW(static_cast<void>(sqrt(f).head()), NoPrincipalRoot);
    EXPECT_EQ(principal_sqrt(SmallFraction(46340 * 46340, 9), "test"), SmallFraction(46340, 3));
}
