// File: src/core/vector_ops.cpp
#include "core/vector_ops.hpp"
#include "core/errors.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <algorithm>

namespace clustra {

EmbeddingVector::EmbeddingVector(size_t dimension) : data_(dimension, 0.0f) {}

EmbeddingVector::EmbeddingVector(const StorageType& data) : data_(data) {}

EmbeddingVector::EmbeddingVector(StorageType&& data) : data_(std::move(data)) {}

EmbeddingVector::EmbeddingVector(std::initializer_list<ValueType> values) : data_(values) {}

void EmbeddingVector::RequireSameDimension(const EmbeddingVector& other) const {
    if (Dimension() != other.Dimension()) {
        throw DimensionMismatchError(Dimension(), other.Dimension());
    }
}

float EmbeddingVector::Norm() const {
    // Accumulate in double so 512-wide sums stay stable
    double sum_sq = 0.0;
    for (float val : data_) {
        sum_sq += static_cast<double>(val) * val;
    }
    return static_cast<float>(std::sqrt(sum_sq));
}

EmbeddingVector EmbeddingVector::Normalized() const {
    float norm = Norm();
    if (norm == 0.0f) {
        return EmbeddingVector(data_.size());
    }

    EmbeddingVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] / norm;
    }
    return result;
}

EmbeddingVector EmbeddingVector::ClampedToMagnitude(float max_magnitude) const {
    if (Norm() > max_magnitude) {
        return Normalized();
    }
    return *this;
}

bool EmbeddingVector::IsFinite() const {
    return std::all_of(data_.begin(), data_.end(),
                       [](float v) { return std::isfinite(v); });
}

float EmbeddingVector::DotProduct(const EmbeddingVector& other) const {
    RequireSameDimension(other);

    double dot = 0.0;
    for (size_t i = 0; i < data_.size(); ++i) {
        dot += static_cast<double>(data_[i]) * other.data_[i];
    }
    return static_cast<float>(dot);
}

float EmbeddingVector::EuclideanDistance(const EmbeddingVector& other) const {
    RequireSameDimension(other);

    double sum_sq_diff = 0.0;
    for (size_t i = 0; i < data_.size(); ++i) {
        double diff = static_cast<double>(data_[i]) - other.data_[i];
        sum_sq_diff += diff * diff;
    }
    return static_cast<float>(std::sqrt(sum_sq_diff));
}

float EmbeddingVector::CosineSimilarity(const EmbeddingVector& other) const {
    float dot = DotProduct(other);
    float norm_product = Norm() * other.Norm();

    if (norm_product == 0.0f) {
        return 0.0f;
    }

    return std::clamp(dot / norm_product, -1.0f, 1.0f);
}

EmbeddingVector EmbeddingVector::operator+(const EmbeddingVector& other) const {
    RequireSameDimension(other);

    EmbeddingVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] + other.data_[i];
    }
    return result;
}

EmbeddingVector EmbeddingVector::operator-(const EmbeddingVector& other) const {
    RequireSameDimension(other);

    EmbeddingVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] - other.data_[i];
    }
    return result;
}

EmbeddingVector EmbeddingVector::operator*(float scalar) const {
    EmbeddingVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] * scalar;
    }
    return result;
}

bool EmbeddingVector::operator==(const EmbeddingVector& other) const {
    if (Dimension() != other.Dimension()) {
        return false;
    }

    for (size_t i = 0; i < data_.size(); ++i) {
        if (std::abs(data_[i] - other.data_[i]) > 1e-6f) {
            return false;
        }
    }
    return true;
}

EmbeddingVector EmbeddingVector::Mean(const std::vector<EmbeddingVector>& vectors) {
    if (vectors.empty()) {
        throw ValidationError("Cannot compute mean of an empty vector set");
    }

    const size_t dim = vectors.front().Dimension();
    std::vector<double> sums(dim, 0.0);
    for (const auto& v : vectors) {
        if (v.Dimension() != dim) {
            throw DimensionMismatchError(dim, v.Dimension());
        }
        for (size_t i = 0; i < dim; ++i) {
            sums[i] += v.data_[i];
        }
    }

    EmbeddingVector result(dim);
    const double count = static_cast<double>(vectors.size());
    for (size_t i = 0; i < dim; ++i) {
        result[i] = static_cast<float>(sums[i] / count);
    }
    return result;
}

std::string EmbeddingVector::ToString(size_t max_elements) const {
    if (data_.empty()) {
        return "EmbeddingVector[]";
    }

    std::ostringstream oss;
    oss << "EmbeddingVector[" << data_.size() << "](";

    size_t count = std::min(max_elements, data_.size());
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) oss << ", ";
        oss << std::fixed << std::setprecision(4) << data_[i];
    }

    if (data_.size() > max_elements) {
        oss << ", ...";
    }
    oss << ")";
    return oss.str();
}

} // namespace clustra
