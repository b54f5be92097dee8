/**
 * @file bindings.cpp
 * @brief pybind11 bindings for structured_view.
 *
 * Type descriptions are written with plain Python objects:
 *
 *   'i32'
 *   {'struct': {'x': ['i32', {'offset': 0}], 'y': ['i8', {'align': 4}]},
 *    'align': 4, 'size': 8}
 *   {'array': ['f32', 4, {'stride': 4}]}
 *   {'array': ['u32', 'unsized']}
 *
 * Accessors are bound to any writable buffer (bytearray, memoryview, numpy
 * array). The buffer stays exported, and therefore alive and fixed-size,
 * for as long as the accessor exists.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "structured_view/accessor.hpp"
#include "structured_view/errors.hpp"
#include "structured_view/factory.hpp"
#include "structured_view/layout.hpp"
#include "structured_view/scalar_kind.hpp"
#include "structured_view/type_desc.hpp"

namespace py = pybind11;
using namespace structured_view;

namespace {

// ============================================================================
// Description parsing
// ============================================================================

std::optional<size_t> optional_size(const py::dict& d, const char* key) {
    if (!d.contains(key) || d[key].is_none()) {
        return std::nullopt;
    }
    return d[key].cast<size_t>();
}

TypeDesc parse_desc(py::handle obj);

TypeDesc parse_array(py::handle entry) {
    if (!py::isinstance<py::sequence>(entry) || py::isinstance<py::str>(entry)) {
        throw py::type_error("'array' expects [element, length | 'unsized', {'stride': n}?]");
    }
    py::sequence seq = py::reinterpret_borrow<py::sequence>(entry);
    if (seq.size() < 2 || seq.size() > 3) {
        throw py::type_error("'array' expects [element, length | 'unsized', {'stride': n}?]");
    }

    TypeDesc element = parse_desc(seq[0]);

    std::optional<size_t> stride;
    if (seq.size() == 3 && !seq[2].is_none()) {
        stride = optional_size(seq[2].cast<py::dict>(), "stride");
    }

    py::object length = seq[1];
    if (py::isinstance<py::str>(length)) {
        if (length.cast<std::string>() != "unsized") {
            throw py::value_error("array length must be a count or 'unsized'");
        }
        return unsized_array(std::move(element), stride);
    }
    return array(std::move(element), length.cast<uint64_t>(), stride);
}

TypeDesc parse_struct(const py::dict& d) {
    std::vector<MemberDesc> members;
    for (auto item : d["struct"].cast<py::dict>()) {
        std::string name = item.first.cast<std::string>();
        py::handle entry = item.second;

        MemberInfo info;
        py::handle type_obj = entry;
        if (py::isinstance<py::list>(entry) || py::isinstance<py::tuple>(entry)) {
            py::sequence seq = py::reinterpret_borrow<py::sequence>(entry);
            if (seq.size() < 1 || seq.size() > 2) {
                throw py::type_error("struct member '" + name + "' expects [type, info?]");
            }
            type_obj = seq[0];
            if (seq.size() == 2 && !seq[1].is_none()) {
                py::dict info_dict = seq[1].cast<py::dict>();
                info.offset = optional_size(info_dict, "offset");
                info.align = optional_size(info_dict, "align");
                info.size = optional_size(info_dict, "size");
            }
        }
        members.push_back(member(std::move(name), parse_desc(type_obj), info));
    }
    return structure(std::move(members), optional_size(d, "align"), optional_size(d, "size"));
}

TypeDesc parse_desc(py::handle obj) {
    if (py::isinstance<py::str>(obj)) {
        return scalar(obj.cast<std::string>());
    }
    if (py::isinstance<py::dict>(obj)) {
        py::dict d = py::reinterpret_borrow<py::dict>(obj);
        if (d.contains("array")) {
            return parse_array(d["array"]);
        }
        if (d.contains("struct")) {
            return parse_struct(d);
        }
        throw py::value_error("type description dict needs an 'array' or 'struct' key");
    }
    throw py::type_error("type description must be a scalar tag, or a dict with "
                         "an 'array' or 'struct' key");
}

// ============================================================================
// Value conversion
// ============================================================================

py::object to_python(const ScalarValue& value) {
    return std::visit([](auto v) -> py::object {
        if constexpr (std::is_floating_point_v<decltype(v)>) {
            return py::float_(static_cast<double>(v));
        } else {
            return py::int_(v);
        }
    }, value);
}

ScalarValue from_python(py::handle obj) {
    if (py::isinstance<py::float_>(obj)) {
        return obj.cast<double>();
    }
    if (py::isinstance<py::int_>(obj)) {
        py::int_ i = py::reinterpret_borrow<py::int_>(obj);
        if (i < py::int_(0)) {
            return i.cast<int64_t>();
        }
        return i.cast<uint64_t>();
    }
    throw py::type_error("scalar fields accept int or float values");
}

// Scalars come back as numbers, nested nodes as accessors tied to `owner`.
py::object child_to_python(Accessor& child, py::handle owner) {
    if (child.kind() == Accessor::Kind::Scalar) {
        return to_python(child.get());
    }
    return py::cast(&child, py::return_value_policy::reference_internal, owner);
}

Accessor& child_of(Accessor& node, py::handle key) {
    if (py::isinstance<py::str>(key)) {
        return node.field(key.cast<std::string>());
    }
    return node.at(key.cast<size_t>());
}

void assign_child(Accessor& node, py::handle key, py::handle value) {
    Accessor& child = child_of(node, key);
    if (child.kind() != Accessor::Kind::Scalar) {
        throw py::type_error("only scalar fields can be assigned; mutate nested "
                             "structs and arrays through their own fields");
    }
    child.set(from_python(value));
}

const char* kind_name(Accessor::Kind kind) {
    switch (kind) {
        case Accessor::Kind::Scalar:       return "scalar";
        case Accessor::Kind::Struct:       return "struct";
        case Accessor::Kind::Array:        return "array";
        case Accessor::Kind::UnsizedArray: return "unsized_array";
    }
    return "?";
}

size_t contiguous_bytes(const py::buffer_info& info) {
    py::ssize_t expected = info.itemsize;
    for (py::ssize_t d = info.ndim - 1; d >= 0; --d) {
        if (info.shape[d] > 1 && info.strides[d] != expected) {
            throw std::invalid_argument("Buffer must be contiguous and C-order");
        }
        expected *= info.shape[d];
    }
    return static_cast<size_t>(info.size * info.itemsize);
}

/**
 * @struct BoundRoot
 * @brief A root accessor plus the buffer export that keeps its bytes valid.
 */
struct BoundRoot {
    BoundRoot(py::buffer_info buffer, RootAccessor accessor)
        : info(std::move(buffer)), root(std::move(accessor)) {}

    py::buffer_info info;  // released after root
    RootAccessor    root;
};

}  // namespace

PYBIND11_MODULE(structured_view, m) {
    m.doc() = "Struct/array layouts and zero-copy accessors over raw buffers";

    py::register_exception<LayoutError>(m, "LayoutError", PyExc_ValueError);
    py::register_exception<AccessError>(m, "AccessError", PyExc_IndexError);

    // Layouts
    py::class_<TypeLayout>(m, "TypeLayout")
        .def_readonly("min_byte_size", &TypeLayout::min_byte_size,
                      "Minimum size in bytes (sized prefix only for unsized layouts)")
        .def_readonly("min_byte_align", &TypeLayout::min_byte_align,
                      "Minimum alignment in bytes")
        .def_readonly("unsized", &TypeLayout::unsized,
                      "True if the layout ends in an unsized array")
        .def_property_readonly("members",
             [](const TypeLayout& l) {
                 py::list out;
                 if (l.is_struct()) {
                     for (const auto& mem : l.as_struct().members) {
                         out.append(py::make_tuple(mem.name, mem.byte_offset));
                     }
                 }
                 return out;
             },
             "(name, byte_offset) pairs for struct layouts")
        .def_property_readonly("byte_stride",
             [](const TypeLayout& l) -> py::object {
                 if (!l.is_array()) {
                     return py::none();
                 }
                 return py::int_(l.as_array().byte_stride);
             },
             "Element stride for array layouts")
        .def("__repr__", [](const TypeLayout& l) {
            return "TypeLayout(" + describe(l) + ")";
        });

    // Accessor nodes (owned by their root; never deleted from Python)
    py::class_<Accessor, std::unique_ptr<Accessor, py::nodelete>>(m, "Accessor")
        .def_property_readonly("kind", [](const Accessor& a) { return kind_name(a.kind()); })
        .def_property_readonly("byte_offset", &Accessor::byte_offset)
        .def_property_readonly("layout", &Accessor::layout,
                               py::return_value_policy::reference_internal)
        .def_property("value",
             [](const Accessor& a) { return to_python(a.get()); },
             [](Accessor& a, py::handle v) { a.set(from_python(v)); },
             "Scalar value (scalar nodes only)")
        .def("__getitem__",
             [](py::object self, py::handle key) {
                 return child_to_python(child_of(self.cast<Accessor&>(), key), self);
             })
        .def("__setitem__",
             [](Accessor& a, py::handle key, py::handle value) {
                 assign_child(a, key, value);
             })
        .def("__len__",
             [](const Accessor& a) {
                 auto n = a.length();
                 if (!n) {
                     throw py::type_error("only fixed-length arrays have a length");
                 }
                 return static_cast<size_t>(*n);
             })
        .def("keys", &Accessor::field_names)
        .def_property_readonly("materialized", &Accessor::materialized,
                               "Elements built so far (unsized arrays)");

    py::class_<BoundRoot>(m, "RootAccessor")
        .def_property("value",
             [](py::object self) {
                 auto& bound = self.cast<BoundRoot&>();
                 return child_to_python(bound.root.value(), self);
             },
             [](BoundRoot& bound, py::handle v) {
                 if (bound.root.value().kind() != Accessor::Kind::Scalar) {
                     throw py::type_error("only scalar roots can be assigned");
                 }
                 bound.root.set(from_python(v));
             },
             "Root value: a number for scalar roots, else the root accessor")
        .def("__getitem__",
             [](py::object self, py::handle key) {
                 auto& bound = self.cast<BoundRoot&>();
                 return child_to_python(child_of(bound.root.value(), key), self);
             })
        .def("__setitem__",
             [](BoundRoot& bound, py::handle key, py::handle value) {
                 assign_child(bound.root.value(), key, value);
             })
        .def_property_readonly("layout",
             [](const BoundRoot& bound) -> const TypeLayout& { return bound.root.layout(); },
             py::return_value_policy::reference_internal)
        .def_property_readonly("base_offset",
             [](const BoundRoot& bound) { return bound.root.base_offset(); })
        .def_property_readonly("byte_length",
             [](const BoundRoot& bound) { return bound.root.backing().byte_length(); });

    py::class_<AccessorFactory>(m, "AccessorFactory")
        .def(py::init([](py::handle desc, bool trace) {
                 AccessorFactory::Config config;
                 config.trace = trace;
                 return std::make_unique<AccessorFactory>(parse_desc(desc), config);
             }),
             py::arg("desc"),
             py::arg("trace") = false,
             "Compute the layout of a type description")
        .def_property_readonly("layout",
             [](const AccessorFactory& f) -> const TypeLayout& { return f.layout(); },
             py::return_value_policy::reference_internal)
        .def("create",
             [](const AccessorFactory& f, py::buffer buffer, size_t byte_offset) {
                 py::buffer_info info = buffer.request(true);
                 const size_t bytes = contiguous_bytes(info);
                 RootAccessor root = f.create(info.ptr, bytes, byte_offset);
                 return std::make_unique<BoundRoot>(std::move(info), std::move(root));
             },
             py::arg("buffer"),
             py::arg("byte_offset") = 0,
             "Bind an accessor to a writable buffer");

    m.def("compute_layout",
          [](py::handle desc) {
              LayoutPtr layout = compute_layout(parse_desc(desc));
              return describe(*layout);
          },
          py::arg("desc"),
          "Describe the layout of a type description");
}
