// File: src/core/vector_ops.hpp
#pragma once

#include <vector>
#include <string>
#include <cstddef>
#include <initializer_list>

namespace clustra {

// EmbeddingVector: Dense fixed-length vector used for centroids and member embeddings.
// Binary operations require equal dimensions and throw DimensionMismatchError otherwise.
class EmbeddingVector {
public:
    using ValueType = float;
    using StorageType = std::vector<ValueType>;

    EmbeddingVector() = default;
    explicit EmbeddingVector(size_t dimension);
    explicit EmbeddingVector(const StorageType& data);
    explicit EmbeddingVector(StorageType&& data);
    EmbeddingVector(std::initializer_list<ValueType> values);

    size_t Dimension() const { return data_.size(); }
    bool IsEmpty() const { return data_.empty(); }

    ValueType operator[](size_t index) const { return data_[index]; }
    ValueType& operator[](size_t index) { return data_[index]; }

    const StorageType& Data() const { return data_; }

    // L2 norm (magnitude)
    float Norm() const;

    // Unit-length copy; the zero vector stays zero
    EmbeddingVector Normalized() const;

    // Unit-length copy when Norm() > max_magnitude, otherwise an unchanged copy
    EmbeddingVector ClampedToMagnitude(float max_magnitude) const;

    // True when every component is finite
    bool IsFinite() const;

    float DotProduct(const EmbeddingVector& other) const;
    float EuclideanDistance(const EmbeddingVector& other) const;

    // Cosine similarity; 0 when either vector has zero norm
    float CosineSimilarity(const EmbeddingVector& other) const;

    EmbeddingVector operator+(const EmbeddingVector& other) const;
    EmbeddingVector operator-(const EmbeddingVector& other) const;
    EmbeddingVector operator*(float scalar) const;

    // Component-wise comparison with 1e-6 tolerance
    bool operator==(const EmbeddingVector& other) const;
    bool operator!=(const EmbeddingVector& other) const { return !(*this == other); }

    // Element-wise mean of a non-empty set of equal-length vectors
    static EmbeddingVector Mean(const std::vector<EmbeddingVector>& vectors);

    std::string ToString(size_t max_elements = 10) const;

private:
    StorageType data_;

    void RequireSameDimension(const EmbeddingVector& other) const;
};

} // namespace clustra
