#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace codalign {

/** Runtime tensor holding arbitrary shaped data. */
class HTensor {
  public:
    /// Supported element types.
    enum class DType { Float32, Float64, Int16, Int32, Int64, UInt8 };

    using Shape = std::vector<std::size_t>;

    HTensor() = default;
    HTensor(DType t, Shape s, std::vector<std::byte> d = {})
        : type_{t}, shape_{std::move(s)}, data_{std::move(d)} {}
    HTensor(const HTensor& other) : type_{other.type_}, shape_{other.shape_}, data_{other.data_} {}
    HTensor(HTensor&& other) noexcept = default;
    HTensor& operator=(const HTensor& other) {
        type_ = other.type_;
        shape_ = other.shape_;
        data_ = other.data_;
        return *this;
    }
    HTensor& operator=(HTensor&& other) noexcept = default;

    const Shape& shape() const { return shape_; }
    DType dtype() const { return type_; }

    const std::vector<std::byte>& data() const { return data_; }
    std::vector<std::byte>& data() { return data_; }

    /// Number of elements implied by the shape.
    std::size_t numel() const {
        if (shape_.empty())
            return 0;
        std::size_t n = 1;
        for (auto d : shape_)
            n *= d;
        return n;
    }

  private:
    DType type_{DType::Float32};
    Shape shape_{};
    std::vector<std::byte> data_{};
};

inline bool operator==(const HTensor& a, const HTensor& b) {
    return a.dtype() == b.dtype() && a.shape() == b.shape() && a.data() == b.data();
}

inline bool operator!=(const HTensor& a, const HTensor& b) { return !(a == b); }

/**
 * @brief Return the size in bytes of a single element for the given type.
 */
inline std::size_t dtype_size(HTensor::DType dt) {
    switch (dt) {
    case HTensor::DType::Int16:
        return 2;
    case HTensor::DType::Float32:
    case HTensor::DType::Int32:
        return 4;
    case HTensor::DType::Float64:
    case HTensor::DType::Int64:
        return 8;
    case HTensor::DType::UInt8:
    default:
        return 1;
    }
}

inline const char* dtype_name(HTensor::DType dt) {
    switch (dt) {
    case HTensor::DType::Float32:
        return "f32";
    case HTensor::DType::Float64:
        return "f64";
    case HTensor::DType::Int16:
        return "i16";
    case HTensor::DType::Int32:
        return "i32";
    case HTensor::DType::Int64:
        return "i64";
    case HTensor::DType::UInt8:
    default:
        return "u8";
    }
}

inline std::string shape_to_string(const HTensor::Shape& s) {
    std::string out = "[";
    for (std::size_t i = 0; i < s.size(); ++i) {
        out += std::to_string(s[i]);
        if (i + 1 < s.size())
            out += ",";
    }
    out += "]";
    return out;
}

/// Map a C++ element type onto its tensor dtype tag.
template <typename T> struct dtype_of;
template <> struct dtype_of<float> {
    static constexpr HTensor::DType value = HTensor::DType::Float32;
};
template <> struct dtype_of<double> {
    static constexpr HTensor::DType value = HTensor::DType::Float64;
};
template <> struct dtype_of<std::int16_t> {
    static constexpr HTensor::DType value = HTensor::DType::Int16;
};
template <> struct dtype_of<std::int32_t> {
    static constexpr HTensor::DType value = HTensor::DType::Int32;
};
template <> struct dtype_of<std::int64_t> {
    static constexpr HTensor::DType value = HTensor::DType::Int64;
};
template <> struct dtype_of<std::uint8_t> {
    static constexpr HTensor::DType value = HTensor::DType::UInt8;
};

/**
 * @brief Copy a typed buffer into a tensor of the given shape.
 *
 * The shape must describe exactly `values.size()` elements.
 */
template <typename T>
inline HTensor make_tensor(const std::vector<T>& values, HTensor::Shape shape) {
    std::size_t elems = shape.empty() ? 0 : 1;
    for (auto d : shape)
        elems *= d;
    if (elems != values.size())
        throw std::invalid_argument("tensor shape " + shape_to_string(shape) +
                                    " does not match " + std::to_string(values.size()) +
                                    " elements");
    std::vector<std::byte> data(values.size() * sizeof(T));
    if (!values.empty())
        std::memcpy(data.data(), values.data(), data.size());
    return HTensor{dtype_of<T>::value, std::move(shape), std::move(data)};
}

/// Convenience overload for 1D tensors.
template <typename T> inline HTensor make_tensor(const std::vector<T>& values) {
    return make_tensor(values, HTensor::Shape{values.size()});
}

/// Copy the elements of a tensor back into a typed vector.
template <typename T> inline std::vector<T> tensor_values(const HTensor& t) {
    if (t.dtype() != dtype_of<T>::value)
        throw std::invalid_argument(std::string("tensor dtype is ") + dtype_name(t.dtype()));
    std::vector<T> out(t.data().size() / sizeof(T));
    if (!out.empty())
        std::memcpy(out.data(), t.data().data(), out.size() * sizeof(T));
    return out;
}

} // namespace codalign
