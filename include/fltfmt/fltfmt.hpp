#ifndef FLTFMT_HPP
#define FLTFMT_HPP

#include "fltfmt/codec/codec.hpp"
#include "fltfmt/core/adjacent.hpp"
#include "fltfmt/core/bits.hpp"
#include "fltfmt/core/bytes.hpp"
#include "fltfmt/core/dpd.hpp"
#include "fltfmt/core/encoding.hpp"
#include "fltfmt/core/enums.hpp"
#include "fltfmt/core/exceptions.hpp"
#include "fltfmt/core/fields.hpp"
#include "fltfmt/core/float.hpp"
#include "fltfmt/core/format.hpp"
#include "fltfmt/core/properties.hpp"
#include "fltfmt/core/rounding.hpp"
#include "fltfmt/formats.hpp"
#include "fltfmt/numeral/conversion.hpp"
#include "fltfmt/numeral/numeral.hpp"

#endif // FLTFMT_HPP
