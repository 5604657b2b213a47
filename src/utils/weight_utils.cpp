#include "utils/weight_utils.hpp"
#include <cnpy.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace weight_utils {
    namespace {
        cnpy::NpyArray load_float_array(const std::filesystem::path& path, size_t expected_rank) {
            if (!std::filesystem::exists(path)) {
                throw std::runtime_error("Missing weight file: " + path.string());
            }
            cnpy::NpyArray arr = cnpy::npy_load(path.string());
            if (arr.word_size != sizeof(float)) {
                std::ostringstream oss;
                oss << "Expected float32 data in " << path.string() << ", got word size " << arr.word_size;
                throw std::runtime_error(oss.str());
            }
            if (arr.shape.size() != expected_rank) {
                std::ostringstream oss;
                oss << "Expected a rank " << expected_rank << " tensor in " << path.string()
                    << ", got rank " << arr.shape.size();
                throw std::runtime_error(oss.str());
            }
            return arr;
        }
    }

    Eigen::RowVectorXf load_1d_tensor(const std::filesystem::path& path) {
        cnpy::NpyArray arr = load_float_array(path, 1);
        return Eigen::Map<Eigen::RowVectorXf>(arr.data<float>(), arr.shape[0]);
    }

    Eigen::MatrixXf load_2d_tensor(const std::filesystem::path& path) {
        cnpy::NpyArray arr = load_float_array(path, 2);
        // numpy writes C order, Eigen defaults to column major.
        using RowMajor = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
        if (arr.fortran_order) {
            return Eigen::Map<Eigen::MatrixXf>(arr.data<float>(), arr.shape[0], arr.shape[1]);
        }
        return Eigen::Map<RowMajor>(arr.data<float>(), arr.shape[0], arr.shape[1]);
    }

    void assert_tensor_shape(const Eigen::MatrixXf& tensor, int rows, int cols, std::string tensor_name) {
        if (tensor.rows() != rows || tensor.cols() != cols) {
            std::ostringstream oss;
            oss << "Tensor shape mismatch for '" << tensor_name << "'.\n";
            oss << "Expected dimensions [" << rows << ", " << cols << "]\n";
            oss << "Got dimensions [" << tensor.rows() << ", " << tensor.cols() << "]\n";
            throw std::runtime_error(oss.str());
        }
    }

    void assert_vector_shape(const Eigen::RowVectorXf& vector, int size, std::string vector_name) {
        if (vector.size() != size) {
            std::ostringstream oss;
            oss << "vector shape mismatch for '" << vector_name << "'.\n";
            oss << "Expected dimensions [" << size << "]\n";
            oss << "Got dimensions [" << vector.size() << "]\n";
            throw std::runtime_error(oss.str());
        }
    }
}
