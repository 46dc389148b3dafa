#pragma once

/// \file
/// \brief Canonical ordering and screening of eigenpairs.
///
/// The canonical layout is a `(size + 1) x size` complex matrix: column `i`
/// holds the eigenvector of mode `i` in rows `0..size-1` and its eigenvalue
/// in row `size`. Screened modes are overwritten with NaN instead of being
/// removed, so shapes and column positions stay stable.

#include <algorithm>
#include <cmath>
#include <complex>
#include <concepts>
#include <limits>
#include <numeric>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <Eigen/Dense>
#include <fmt/core.h>

#include <specdeform/core/errors.hpp>
#include <specdeform/core/log.hpp>
#include <specdeform/core/types.hpp>

namespace specdeform::ops {

namespace detail {

template <typename T> struct is_std_complex : std::false_type {};
template <typename T>
struct is_std_complex<std::complex<T>> : std::is_floating_point<T> {};

/// \brief Scalars with a NaN value to use as the screening sentinel.
template <typename T>
concept NanRepresentable = std::floating_point<T> || is_std_complex<T>::value;

} // namespace detail

/// \brief Per-mode array screened alongside the eigenvalue matrix.
///
/// Integer arrays are rejected: they have no NaN to mark a screened mode.
template <typename Q>
concept PhysicalQuantity = std::derived_from<Q, Eigen::DenseBase<Q>> &&
                           detail::NanRepresentable<typename Q::Scalar>;

namespace detail {

/// \brief `a < b` with every NaN ordered after all numbers.
inline bool nan_last_less(double a, double b) {
  const bool a_nan = std::isnan(a);
  const bool b_nan = std::isnan(b);
  if (a_nan || b_nan) {
    return !a_nan && b_nan;
  }
  return a < b;
}

template <NanRepresentable ScalarT> ScalarT nan_sentinel() {
  if constexpr (is_std_complex<ScalarT>::value) {
    using Real = typename ScalarT::value_type;
    const Real nan = std::numeric_limits<Real>::quiet_NaN();
    return ScalarT(nan, nan);
  } else {
    return std::numeric_limits<ScalarT>::quiet_NaN();
  }
}

[[noreturn]] inline void shape_mismatch(const char *where, const std::string &message) {
  core::Logger(where).error("Invalid shape of the input arrays");
  throw core::ShapeMismatch(fmt::format("{}: {}", where, message));
}

} // namespace detail

/**
 * \brief Lexicographic `(real, imag)` order on eigenvalues.
 *
 * NaN components sort after all numbers, which keeps the order total for
 * already-screened matrices.
 */
inline bool eigenvalue_less(const core::Scalar &a, const core::Scalar &b) {
  if (detail::nan_last_less(a.real(), b.real())) {
    return true;
  }
  if (detail::nan_last_less(b.real(), a.real())) {
    return false;
  }
  return detail::nan_last_less(a.imag(), b.imag());
}

/**
 * \brief Stable permutation that sorts `eigenvalues` by `eigenvalue_less`.
 * \return `order[k]` is the input index placed at output position `k`.
 */
inline std::vector<Eigen::Index> eigenvalue_order(const Eigen::VectorXcd &eigenvalues) {
  std::vector<Eigen::Index> order(static_cast<size_t>(eigenvalues.size()));
  std::iota(order.begin(), order.end(), Eigen::Index{0});
  std::stable_sort(order.begin(), order.end(),
                   [&](Eigen::Index lhs, Eigen::Index rhs) {
                     return eigenvalue_less(eigenvalues[lhs], eigenvalues[rhs]);
                   });
  return order;
}

/**
 * \brief Assemble the canonical eigenvalue matrix in ascending eigenvalue order.
 * \param eigenvalues `size` eigenvalues.
 * \param eigenvectors `size x size` matrix, column `i` paired with eigenvalue `i`.
 * \throws core::ShapeMismatch if `eigenvectors` is not `size x size`.
 */
inline core::EigenMatrix sort_by_eigenvalue(const Eigen::VectorXcd &eigenvalues,
                                            const Eigen::MatrixXcd &eigenvectors) {
  const Eigen::Index size = eigenvalues.size();
  if (eigenvectors.rows() != size || eigenvectors.cols() != size) {
    detail::shape_mismatch(
        "sort_by_eigenvalue",
        fmt::format("expected {0}x{0} eigenvectors for {0} eigenvalues, got {1}x{2}",
                    size, eigenvectors.rows(), eigenvectors.cols()));
  }

  const auto order = eigenvalue_order(eigenvalues);

  core::EigenMatrix out(size + 1, size);
  for (Eigen::Index k = 0; k < size; ++k) {
    const Eigen::Index src = order[static_cast<size_t>(k)];
    out.col(k).head(size) = eigenvectors.col(src);
    out(size, k) = eigenvalues[src];
  }
  return out;
}

/**
 * \brief Re-sort an existing canonical matrix.
 * \throws core::ShapeMismatch unless `eigen_matrix` has one more row than columns.
 */
inline core::EigenMatrix sort_by_eigenvalue(const core::EigenMatrix &eigen_matrix) {
  const Eigen::Index size = eigen_matrix.cols();
  if (eigen_matrix.rows() != size + 1) {
    detail::shape_mismatch(
        "sort_by_eigenvalue",
        fmt::format("expected {} rows for {} modes, got {}", size + 1, size,
                    eigen_matrix.rows()));
  }
  return sort_by_eigenvalue(eigen_matrix.row(size).transpose(),
                            eigen_matrix.topRows(size));
}

/**
 * \brief Invalidate modes that fail `mask`, in place.
 *
 * Every shape is checked before anything is written: the matrix must be
 * `(size + 1) x size` and every quantity must hold `size` entries, with
 * `size = mask.size()`. For each `i` with `mask[i] == false`, column `i` of
 * the matrix and entry `i` of every quantity become NaN.
 * \return Number of screened modes.
 * \throws core::ShapeMismatch on any shape disagreement; no input is modified.
 */
template <PhysicalQuantity... Quantities>
Eigen::Index screen_eigenmodes(core::EigenMatrix &eigen_matrix,
                               const core::ValidityMask &mask,
                               Quantities &...quantities) {
  const Eigen::Index size = mask.size();
  if (eigen_matrix.cols() != size || eigen_matrix.rows() != size + 1) {
    detail::shape_mismatch(
        "screen_eigenmodes",
        fmt::format("expected a {}x{} eigenvalue matrix for {} mask entries, got {}x{}",
                    size + 1, size, size, eigen_matrix.rows(), eigen_matrix.cols()));
  }

  int position = 0;
  const auto check_quantity = [&](const auto &quantity) {
    if (quantity.size() != size) {
      detail::shape_mismatch(
          "screen_eigenmodes",
          fmt::format("physical quantity #{} has {} entries, expected {}",
                      position, quantity.size(), size));
    }
    ++position;
  };
  (check_quantity(quantities), ...);

  const core::Scalar sentinel = detail::nan_sentinel<core::Scalar>();
  Eigen::Index screened = 0;
  for (Eigen::Index i = 0; i < size; ++i) {
    if (mask[i]) {
      continue;
    }
    eigen_matrix.col(i).setConstant(sentinel);
    ((quantities.coeffRef(i) =
          detail::nan_sentinel<typename Quantities::Scalar>()),
     ...);
    ++screened;
  }
  return screened;
}

/// \brief Result of the copying screen.
template <typename... Quantities> struct ScreenedEigenmodes {
  core::EigenMatrix matrix;
  std::tuple<Quantities...> quantities;
  Eigen::Index n_screened = 0;
};

/**
 * \brief Copying variant of `screen_eigenmodes`; the inputs are untouched.
 * \throws core::ShapeMismatch on any shape disagreement.
 */
template <PhysicalQuantity... Quantities>
ScreenedEigenmodes<typename Quantities::PlainObject...>
screened_eigenmodes(const core::EigenMatrix &eigen_matrix,
                    const core::ValidityMask &mask,
                    const Quantities &...quantities) {
  ScreenedEigenmodes<typename Quantities::PlainObject...> out{
      eigen_matrix, std::tuple<typename Quantities::PlainObject...>(quantities...),
      0};
  out.n_screened = std::apply(
      [&](auto &...copies) {
        return screen_eigenmodes(out.matrix, mask, copies...);
      },
      out.quantities);
  return out;
}

/**
 * \brief Number of modes whose eigenvalue is not NaN.
 * \throws core::ShapeMismatch unless `eigen_matrix` has one more row than columns.
 */
inline Eigen::Index count_valid_modes(const core::EigenMatrix &eigen_matrix) {
  const Eigen::Index size = eigen_matrix.cols();
  if (eigen_matrix.rows() != size + 1) {
    detail::shape_mismatch(
        "count_valid_modes",
        fmt::format("expected {} rows for {} modes, got {}", size + 1, size,
                    eigen_matrix.rows()));
  }

  Eigen::Index valid = 0;
  for (Eigen::Index i = 0; i < size; ++i) {
    const core::Scalar value = eigen_matrix(size, i);
    if (!std::isnan(value.real()) && !std::isnan(value.imag())) {
      ++valid;
    }
  }
  return valid;
}

} // namespace specdeform::ops
