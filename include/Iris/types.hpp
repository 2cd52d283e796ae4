#ifndef IRIS_TYPES
#define IRIS_TYPES

#include <data/maybe.hpp>
#include <data/bytes.hpp>
#include <data/tools.hpp>
#include <data/io/exception.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <compare>
#include <ostream>
#include <string>
#include <vector>
#include <memory>

namespace Iris {
    using namespace data;

    using uint512 = boost::multiprecision::uint512_t;

    // a block height.
    using block_height = uint32;

    template <typename X> using ptr = std::shared_ptr<X>;
}

#endif
