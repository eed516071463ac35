#ifndef FLTFMT_CORE_FIELDS_HPP
#define FLTFMT_CORE_FIELDS_HPP

// Raw field access for a compiled format: split a byte buffer into its
// declared fields, join logical fields made of several pieces, and pack
// a field list back into bytes.

#include <map>
#include <string>

#include "fltfmt/core/bytes.hpp"
#include "fltfmt/core/exceptions.hpp"
#include "fltfmt/core/format.hpp"

namespace fltfmt {

inline void checkLength(const FormatSpec &Spec, const EncodedBytes &Data) {
  if (Data.size() != Spec.totalBytes())
    throw EncodingError(Spec.name() + " values are " +
                        std::to_string(Spec.totalBytes()) + " bytes, got " +
                        std::to_string(Data.size()));
}

// Unpacks, then runs the format's unpack hook.
inline FieldValues unpackFieldValues(const FormatSpec &Spec,
                                     const EncodedBytes &Data) {
  checkLength(Spec, Data);
  FieldValues Values =
      unpackFields(Data.Bytes, Spec.widths(), Spec.unitBits(), Data.Order,
                   Spec.bitsLittleEndian());
  if (Spec.unpackHook())
    Spec.unpackHook()(Values);
  return Values;
}

// Runs the format's pack hook, then packs.
inline EncodedBytes packFieldValues(const FormatSpec &Spec,
                                    FieldValues Values) {
  if (Spec.packHook())
    Spec.packHook()(Values);
  return {packFields(Values, Spec.widths(), Spec.unitBits(),
                     Spec.endianness(), Spec.bitsLittleEndian()),
          Spec.endianness()};
}

// Value of a logical field; pieces are joined first-piece-lowest.
inline bits_t getField(const FormatSpec &Spec, const FieldValues &Values,
                       const std::string &Name) {
  bits_t Result = 0;
  mp_bitcnt_t Offset = 0;
  for (int I : Spec.fieldPieces(Name)) {
    Result += Values[I] << Offset;
    Offset += static_cast<mp_bitcnt_t>(Spec.widths()[I]) * Spec.unitBits();
  }
  return Result;
}

inline void setField(const FormatSpec &Spec, FieldValues &Values,
                     const std::string &Name, const bits_t &Val) {
  const auto &Pieces = Spec.fieldPieces(Name);
  if (Pieces.empty())
    return;
  std::vector<int> PieceWidths;
  for (int I : Pieces)
    PieceWidths.push_back(Spec.widths()[I]);
  bits_t Limit = bits_t(1) << static_cast<mp_bitcnt_t>(
                     fieldsTotalBits(PieceWidths, Spec.unitBits()));
  if (Val < 0 || Val >= Limit)
    throw EncodingError("value " + Val.get_str(16) +
                        " does not fit field '" + Name + "'");
  std::vector<bits_t> Parts = splitInteger(Val, PieceWidths, Spec.unitBits());
  for (size_t K = 0; K < Pieces.size(); ++K)
    Values[Pieces[K]] = Parts[K];
}

inline std::map<std::string, bits_t>
fieldsByName(const FormatSpec &Spec, const FieldValues &Values) {
  std::map<std::string, bits_t> Result;
  for (const FieldDef &F : Spec.fields())
    if (!Result.count(F.Name))
      Result[F.Name] = getField(Spec, Values, F.Name);
  return Result;
}

// Fields missing from the map are zero.
inline FieldValues fieldsFromNames(const FormatSpec &Spec,
                                   const std::map<std::string, bits_t> &Named) {
  FieldValues Values(Spec.fields().size(), bits_t(0));
  for (const auto &[Name, Val] : Named) {
    if (!Spec.hasField(Name))
      throw EncodingError(Spec.name() + " has no field '" + Name + "'");
    setField(Spec, Values, Name, Val);
  }
  return Values;
}

} // namespace fltfmt

#endif // FLTFMT_CORE_FIELDS_HPP
