#pragma once
#include <Eigen/Dense>
#include <cstddef>

namespace cairn::core {

// Row-per-state storage for composition tables ([n_states x n_species])
template <typename Scalar = double>
class Matrix {
private:
  Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> data_;

public:
  Matrix() = default;
  Matrix(std::size_t rows, std::size_t cols) : data_(rows, cols) {}

  Matrix(Matrix&&) = default;
  Matrix& operator=(Matrix&&) = default;

  Matrix(const Matrix&) = default;
  Matrix& operator=(const Matrix&) = default;

  [[nodiscard]] auto rows() const noexcept -> std::size_t { return data_.rows(); }
  [[nodiscard]] auto cols() const noexcept -> std::size_t { return data_.cols(); }

  auto operator()(std::size_t i, std::size_t j) -> Scalar& { return data_(i, j); }
  [[nodiscard]] auto operator()(std::size_t i, std::size_t j) const -> const Scalar& { return data_(i, j); }

  [[nodiscard]] auto eigen() -> auto& { return data_; }
  [[nodiscard]] auto eigen() const -> auto& { return data_; }
  void setZero() { data_.setZero(); }
  void fill(Scalar value) { data_.setConstant(value); }
};

} // namespace cairn::core
