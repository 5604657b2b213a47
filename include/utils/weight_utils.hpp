#pragma once
#include <Eigen/Dense>
#include <filesystem>
#include <string>

namespace weight_utils {
    // Load 1D tensor (bias vectors, layer norm parameters)
    Eigen::RowVectorXf load_1d_tensor(const std::filesystem::path& path);

    // Load 2D tensor (weight matrices, embedding tables)
    Eigen::MatrixXf load_2d_tensor(const std::filesystem::path& path);

    // Throw std::runtime_error when the tensor does not have the expected shape
    void assert_tensor_shape(const Eigen::MatrixXf& tensor, int rows, int cols, std::string tensor_name = "[no_name]");
    void assert_vector_shape(const Eigen::RowVectorXf& vector, int size, std::string vector_name = "[no_name]");
}
