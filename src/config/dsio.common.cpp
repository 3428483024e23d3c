#include "dsio.common.hh"
#include "macros.hh"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {
constexpr uint64_t MAX_U64 = std::numeric_limits<uint64_t>::max();

bool
has_zero_extent(const dsio::Shape& shape)
{
    return std::find(shape.begin(), shape.end(), 0) != shape.end();
}
} // namespace

uint64_t
dsio::volume(const Shape& shape)
{
    if (has_zero_extent(shape)) {
        return 0;
    }

    uint64_t n = 1;
    for (const auto& extent : shape) {
        EXPECT_AS(std::overflow_error,
                  n <= MAX_U64 / extent,
                  "Number of elements in shape ",
                  shape_to_string(shape),
                  " overflows 64 bits");
        n *= extent;
    }

    return n;
}

bool
dsio::size_in_bytes_fits(const Shape& shape, size_t itemsize) noexcept
{
    if (has_zero_extent(shape)) {
        return true;
    }

    uint64_t n = std::max<uint64_t>(itemsize, 1);
    for (const auto& extent : shape) {
        if (n > MAX_U64 / extent) {
            return false;
        }
        n *= extent;
    }

    return true;
}

std::string
dsio::shape_to_string(const Shape& shape)
{
    std::ostringstream ss;
    ss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << shape[i];
    }

    // one-element tuples keep their trailing comma
    if (shape.size() == 1) {
        ss << ",";
    }
    ss << ")";

    return ss.str();
}

std::string
dsio::join(const std::vector<std::string>& items, std::string_view separator)
{
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += items[i];
    }

    return joined;
}

std::vector<std::string>
dsio::split_location(std::string_view location)
{
    std::vector<std::string> segments;

    size_t start = 0;
    while (true) {
        const auto pos = location.find('/', start);
        if (pos == std::string_view::npos) {
            segments.emplace_back(location.substr(start));
            break;
        }

        segments.emplace_back(location.substr(start, pos - start));
        start = pos + 1;
    }

    return segments;
}

std::string
dsio::human_readable_bytes(uint64_t nbytes)
{
    constexpr const char* units[] = { "B", "KB", "MB", "GB", "TB", "PB" };
    constexpr size_t n_units = sizeof(units) / sizeof(units[0]);

    auto value = static_cast<double>(nbytes);
    size_t unit = 0;
    while (value >= 1000.0 && unit < n_units - 1) {
        value /= 1000.0;
        ++unit;
    }

    std::ostringstream ss;
    if (unit == 0) {
        ss << nbytes << " B";
    } else {
        ss << std::fixed << std::setprecision(2) << value << " "
           << units[unit];
    }

    return ss.str();
}

const char*
dsio::backend_to_string(DsioBackend backend)
{
    switch (backend) {
        case DsioBackend_HDF5:
            return "hdf5";
        case DsioBackend_Zarr:
            return "zarr";
        default:
            throw std::invalid_argument("Invalid backend: " +
                                        std::to_string(backend));
    }
}

uint32_t
dsio::available_cpu_count()
{
    const auto n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}
