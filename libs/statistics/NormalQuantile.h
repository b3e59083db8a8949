// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cmath>
#include <stdexcept>

namespace abtesting
{
  namespace detail
  {
    constexpr double kInvSqrt2 = 0.7071067811865475244;
    constexpr double kInvSqrt2Pi = 0.3989422804014326779;
    constexpr double kSqrt2Pi = 2.5066282746310005024;

    /**
     * @brief Standard normal density phi(z).
     */
    inline double compute_normal_pdf(double z) noexcept
    {
      return kInvSqrt2Pi * std::exp(-0.5 * z * z);
    }

    /**
     * @brief Standard normal CDF Phi(z) = 0.5 * (1 + erf(z / sqrt(2))).
     *
     * std::erf is accurate to a few ulps, so the absolute error of the result is
     * about 1e-16. In the far lower tail the complementary form is used so that
     * small probabilities keep their relative accuracy.
     */
    inline double compute_normal_cdf(double z) noexcept
    {
      if (z < -5.0)
        return 0.5 * std::erfc(-z * kInvSqrt2);

      return 0.5 * (1.0 + std::erf(z * kInvSqrt2));
    }

    /**
     * @brief Upper tail 1 - Phi(z), computed with erfc to avoid cancellation.
     */
    inline double compute_normal_survival(double z) noexcept
    {
      return 0.5 * std::erfc(z * kInvSqrt2);
    }

    /**
     * @brief Quantile (inverse CDF) of the standard normal distribution.
     *
     * Acklam's rational approximation (relative error < 1.15e-9) followed by a
     * single Halley step against compute_normal_cdf, which brings the error down
     * to the accuracy of std::erfc.
     *
     * @param p Probability in (0, 1)
     * @return z such that Phi(z) = p
     * @throws std::domain_error if p is not in (0, 1)
     */
    inline double compute_normal_quantile(double p)
    {
      if (!(p > 0.0 && p < 1.0))
        throw std::domain_error("compute_normal_quantile: probability p must be in (0, 1)");

      if (p == 0.5)
        return 0.0;

      static constexpr double a1 = -3.969683028665376e+01;
      static constexpr double a2 =  2.209460984245205e+02;
      static constexpr double a3 = -2.759285104469687e+02;
      static constexpr double a4 =  1.383577518672690e+02;
      static constexpr double a5 = -3.066479806614716e+01;
      static constexpr double a6 =  2.506628277459239e+00;

      static constexpr double b1 = -5.447609879822406e+01;
      static constexpr double b2 =  1.615858368580409e+02;
      static constexpr double b3 = -1.556989798598866e+02;
      static constexpr double b4 =  6.680131188771972e+01;
      static constexpr double b5 = -1.328068155288572e+01;

      static constexpr double c1 = -7.784894002430226e-03;
      static constexpr double c2 = -3.223964580411365e-01;
      static constexpr double c3 = -2.400758277161838e+00;
      static constexpr double c4 = -2.549732539343734e+00;
      static constexpr double c5 =  4.374664141464968e+00;
      static constexpr double c6 =  2.938163982698783e+00;

      static constexpr double d1 =  7.784695709041462e-03;
      static constexpr double d2 =  3.224671290700398e-01;
      static constexpr double d3 =  2.445134137142996e+00;
      static constexpr double d4 =  3.754408661907416e+00;

      static constexpr double pLow  = 0.02425;
      static constexpr double pHigh = 1.0 - pLow;

      double x;
      if (p < pLow)
        {
          const double q = std::sqrt(-2.0 * std::log(p));
          x = (((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
            ((((d1 * q + d2) * q + d3) * q + d4) * q + 1.0);
        }
      else if (p <= pHigh)
        {
          const double q = p - 0.5;
          const double r = q * q;
          x = (((((a1 * r + a2) * r + a3) * r + a4) * r + a5) * r + a6) * q /
            (((((b1 * r + b2) * r + b3) * r + b4) * r + b5) * r + 1.0);
        }
      else
        {
          const double q = std::sqrt(-2.0 * std::log(1.0 - p));
          x = -(((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
            ((((d1 * q + d2) * q + d3) * q + d4) * q + 1.0);
        }

      // Halley refinement
      const double e = compute_normal_cdf(x) - p;
      const double u = e * kSqrt2Pi * std::exp(0.5 * x * x);
      x = x - u / (1.0 + 0.5 * x * u);

      return x;
    }

    /**
     * @brief Two-sided critical value z such that P(-z < Z < z) = confidenceLevel.
     *
     * @throws std::domain_error if confidenceLevel is not in (0, 1)
     */
    inline double compute_normal_critical_value(double confidenceLevel)
    {
      if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
        throw std::domain_error("compute_normal_critical_value: confidence level must be in (0, 1)");

      return compute_normal_quantile(1.0 - (1.0 - confidenceLevel) / 2.0);
    }

    /**
     * @brief Two-sided p-value of a standard normal test statistic.
     */
    inline double compute_two_sided_normal_pvalue(double z) noexcept
    {
      return std::fmin(1.0, 2.0 * compute_normal_survival(std::fabs(z)));
    }
  }
}
