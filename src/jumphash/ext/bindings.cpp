/**
 * jumphash Python Bindings (pybind11)
 *
 * Exposes the C++ core as `_jumphash_native`, so Python callers get the
 * exact bucket choices the C++ library makes.
 *
 * Build:
 *   pip install pybind11
 *   mkdir build && cd build
 *   cmake .. -DJUMPHASH_BUILD_PYTHON=ON
 *   cmake --build .
 */

// MinGW workaround: include these before pybind11
#include <mutex>
#include <cstring>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <jumphash/jumphash.hpp>
#include <vector>

namespace py = pybind11;

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Bucket of every key in a 1-D uint64 array, as an int32 numpy array
 */
py::array_t<int32_t> jump_hash_batch(
    py::array_t<uint64_t, py::array::c_style | py::array::forcecast> keys,
    int32_t num_buckets
) {
    jumphash::detail::check_num_buckets(num_buckets);

    auto in = keys.unchecked<1>();
    py::array_t<int32_t> result(in.shape(0));
    auto buf = result.mutable_unchecked<1>();

    for (py::ssize_t i = 0; i < in.shape(0); ++i) {
        buf(i) = jumphash::jump_hash(in(i), num_buckets);
    }

    return result;
}

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(_jumphash_native, m) {
    m.doc() = R"doc(
jumphash — Jump Consistent Hash (Native C++ Extension)

Lamping & Veach jump consistent hash. Identical (key, num_buckets)
inputs give identical buckets here and in the C++ library.

Invalid bucket counts (< 1) raise ValueError.
)doc";

    // Version info
    m.attr("__version__") = JUMPHASH_VERSION_STRING;

    // ========================================================================
    // Functions
    // ========================================================================
    m.def("jump_hash", py::overload_cast<uint64_t, int32_t>(&jumphash::jump_hash),
        py::arg("key"),
        py::arg("num_buckets"),
        "Bucket in [0, num_buckets) for a 64-bit integer key");

    m.def("jump_hash", py::overload_cast<std::string_view, int32_t>(&jumphash::jump_hash),
        py::arg("key"),
        py::arg("num_buckets"),
        "Bucket in [0, num_buckets) for a string key (FNV-1a 64 of its UTF-8 bytes)");

    m.def("jump_hash_batch", &jump_hash_batch,
        py::arg("keys"),
        py::arg("num_buckets"),
        "Buckets for a 1-D array of uint64 keys, as a numpy int32 array");

    m.def("fnv1a_64", &jumphash::fnv1a_64,
        py::arg("data"),
        "64-bit FNV-1a digest used to turn strings into keys");

    // ========================================================================
    // Lcg64 — embedded PRNG
    // ========================================================================
    py::class_<jumphash::Lcg64>(m, "Lcg64",
        "64-bit linear congruential generator driving jump hash")
        .def(py::init<uint64_t>(), py::arg("seed"))
        .def("next", &jumphash::Lcg64::next, "Advance and return the new state")
        .def("state", &jumphash::Lcg64::state)
        .def_static("step", &jumphash::Lcg64::step,
            py::arg("state"),
            "Stateless single step")
        .def_readonly_static("multiplier", &jumphash::Lcg64::multiplier)
        .def_readonly_static("increment", &jumphash::Lcg64::increment);

    // ========================================================================
    // JumpBuckets
    // ========================================================================
    py::class_<jumphash::JumpBuckets>(m, "JumpBuckets",
        R"doc(
Fixed-size bucket set.

Args:
    num_buckets: Bucket count (>= 1)
)doc")
        .def(py::init<int32_t>(), py::arg("num_buckets"))
        .def("bucket", py::overload_cast<uint64_t>(&jumphash::JumpBuckets::bucket, py::const_),
            py::arg("key"))
        .def("bucket", py::overload_cast<std::string_view>(&jumphash::JumpBuckets::bucket, py::const_),
            py::arg("key"))
        .def("assign", &jumphash::JumpBuckets::assign, py::arg("keys"))
        .def("resize", &jumphash::JumpBuckets::resize, py::arg("num_buckets"))
        .def("size", &jumphash::JumpBuckets::size)
        .def_static("bucket_sequence", &jumphash::JumpBuckets::bucket_sequence,
            py::arg("key"), py::arg("max_buckets"))
        .def("__len__", &jumphash::JumpBuckets::size)
        .def("__getitem__", &jumphash::JumpBuckets::operator[]);
}
