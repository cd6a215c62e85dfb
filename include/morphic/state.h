#pragma once

// State records are property bags describing one shape at one instant.  The interpolation engine consumes them through
// the abstract State interface; PropertyState is a general purpose implementation that keeps fields in insertion order.

#include <memory>
#include <set>
#include <variant>
#include <morphic/colour.h>
#include <morphic/easing.h>
#include <morphic/vertex.h>

namespace mx {

typedef std::variant<double, bool, std::string, Colour, VertexContours> FieldValue;
typedef std::set<std::string, std::less<>> FIELDS;

class State {
public:
   virtual ~State() = default;

   virtual std::unique_ptr<State> clone() const = 0;

   // Field names in declaration order.

   virtual std::vector<std::string> field_names() const = 0;

   // Returns nullptr if the field does not exist.

   virtual const FieldValue * get(std::string_view Field) const = 0;

   virtual ERR set(std::string_view Field, FieldValue Value) = 0;

   inline bool has(std::string_view Field) const { return get(Field) != nullptr; }

   virtual bool is_angle(std::string_view Field) const { return Field IS "rotation"; }

   // Fields that must switch at the midpoint rather than blend.

   virtual const FIELDS & non_interpolatable() const;

   // Per-field easing declared by the state type.

   virtual const EASING_MAP & default_easing() const;

   // Closure of the state's outline.  Open shapes do not have their first and last vertices joined.

   virtual bool closed() const { return true; }
};

//********************************************************************************************************************

class PropertyState : public State {
   private:
      std::vector<std::pair<std::string, FieldValue>> properties;

   public:
      FIELDS angle_fields { "rotation" };
      FIELDS fixed_fields;
      EASING_MAP easing;
      bool is_closed = true;

      PropertyState() = default;
      PropertyState(std::initializer_list<std::pair<std::string, FieldValue>> Properties) : properties(Properties) { }

      std::unique_ptr<State> clone() const override { return std::make_unique<PropertyState>(*this); }
      std::vector<std::string> field_names() const override;
      const FieldValue * get(std::string_view Field) const override;
      ERR set(std::string_view Field, FieldValue Value) override;

      bool is_angle(std::string_view Field) const override { return angle_fields.contains(Field); }
      const FIELDS & non_interpolatable() const override { return fixed_fields; }
      const EASING_MAP & default_easing() const override { return easing; }
      bool closed() const override { return is_closed; }

      // Returns the value of Field if it holds a T, otherwise nullptr.

      template <class T> const T * get_as(std::string_view Field) const {
         if (auto value = get(Field)) return std::get_if<T>(value);
         return nullptr;
      }
};

} // namespace
