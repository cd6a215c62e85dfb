#pragma once

// Vertex alignment strategies.  An aligner reorders the second of two equal-length vertex lists so that vertex i of
// each list is a good partner for interpolation.  The strategy is chosen by the closure of the two shapes:
//
//   closed <-> closed : AngularAligner (angle around the centroid)
//   open   <-> closed : EuclideanAligner (straight line distance, closed shape is rotated)
//   open   <-> open   : SequentialAligner (forward or reversed)

#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <morphic/vertex.h>

namespace mx {

class LoopMapper;

enum class NORM : int {
   L1 = 0, // Sum of distances
   L2,     // Square root of the sum of squared distances
   LINF,   // Maximum distance
   CUSTOM
};

extern ERR parse_norm(std::string_view Value, NORM &Result);
extern CSTRING norm_name(NORM Norm);

struct AlignmentContext {
   double rotation1 = 0; // World rotation of the first shape, in degrees
   double rotation2 = 0;
   bool closed1 = true;
   bool closed2 = true;
};

// Custom distance functions receive the two sequences and the candidate offset of the second.  An aligner with the
// CUSTOM norm and no function fails with ERR::NullArgs.

typedef std::function<double(const std::vector<double> &, const std::vector<double> &, size_t)> ANGULAR_DISTANCE;
typedef std::function<double(const VERTICES &, const VERTICES &, size_t)> EUCLIDEAN_DISTANCE;

//********************************************************************************************************************

class VertexAligner {
public:
   virtual ~VertexAligner() = default;

   // Aligns the lists in place.  RotationTarget overrides Context.rotation2 when defined.

   virtual ERR align(VERTICES &Verts1, VERTICES &Verts2, const AlignmentContext &Context,
      std::optional<double> RotationTarget = std::nullopt) = 0;

   virtual CSTRING name() const = 0;
};

//********************************************************************************************************************

class AngularAligner : public VertexAligner {
   private:
      NORM norm;
      ANGULAR_DISTANCE custom;

   public:
      AngularAligner(NORM Norm = NORM::L1) : norm(Norm) { }
      AngularAligner(ANGULAR_DISTANCE Function) : norm(NORM::CUSTOM), custom(std::move(Function)) { }

      inline NORM get_norm() const { return norm; }

      ERR align(VERTICES &, VERTICES &, const AlignmentContext &, std::optional<double> = std::nullopt) override;
      CSTRING name() const override { return "angular"; }
};

class EuclideanAligner : public VertexAligner {
   private:
      NORM norm;
      EUCLIDEAN_DISTANCE custom;

   public:
      EuclideanAligner(NORM Norm = NORM::L1) : norm(Norm) { }
      EuclideanAligner(EUCLIDEAN_DISTANCE Function) : norm(NORM::CUSTOM), custom(std::move(Function)) { }

      inline NORM get_norm() const { return norm; }

      ERR align(VERTICES &, VERTICES &, const AlignmentContext &, std::optional<double> = std::nullopt) override;
      CSTRING name() const override { return "euclidean"; }
};

class SequentialAligner : public VertexAligner {
   public:
      ERR align(VERTICES &, VERTICES &, const AlignmentContext &, std::optional<double> = std::nullopt) override;
      CSTRING name() const override { return "sequential"; }
};

//********************************************************************************************************************
// Selects an aligner from the closure of the two shapes.  If Norm is empty then it is read from the configuration.

extern ERR get_aligner(bool Closed1, bool Closed2, std::string_view Norm, std::unique_ptr<VertexAligner> &Result);

// Prepares two contours for interpolation: the outer loops are aligned, holes are mapped to one another and every
// matched pair of equal-length holes is angularly aligned.  Null strategies are selected automatically.

extern ERR align_contours(const VertexContours &Contours1, const VertexContours &Contours2,
   const AlignmentContext &Context, VertexContours &Result1, VertexContours &Result2,
   VertexAligner *Aligner = nullptr, LoopMapper *Mapper = nullptr, std::optional<double> RotationTarget = std::nullopt);

} // namespace
