///\file axis.h
///This file defines the histogram axis type, which maps external coordinates to bins
///through an explicit list of bin edges, and the specifications from which axes may be built.

#ifndef GRIDHIST_AXIS_H
#define GRIDHIST_AXIS_H

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

namespace grid_hist{
	namespace histograms{

		///Ways of choosing a bin edge close to an arbitrary coordinate
		enum snapMode{
			SNAP_NEAREST, ///<the closer of the two edges bounding the coordinate's bin
			SNAP_LOW,     ///<the lower edge of the coordinate's bin
			SNAP_HIGH,    ///<the upper edge of the coordinate's bin
			SNAP_BOTH,    ///<both bounding edges
			SNAP_EXPAND,  ///<outward to the edge which keeps the coordinate inside the range
			SNAP_CLIP     ///<like SNAP_EXPAND, but the boundary edge is then moved to the coordinate itself
		};

		///Converts a snap keyword ("nearest", "low", "high", "both", "expand", "clip") to a snapMode
		///\throws validationError if the keyword is not recognized
		snapMode parseSnap(const std::string& name);

		///Gets the keyword corresponding to a snapMode
		std::string snapName(snapMode snap);

		///\brief A single histogram dimension, defined by strictly increasing bin edges.
		///
		///Bins follow the half-open convention: bin i contains coordinates x with
		///edges[i] <= x < edges[i+1]. The optional label is purely descriptive and does not
		///participate in comparisons.
		class axis{
		public:
			typedef int internalCoordinate;
			typedef double externalCoordinate;
		private:
			std::vector<externalCoordinate> edges;
			std::string label;

			///\throws validationError unless e has at least two strictly increasing entries
			static void checkEdges(const std::vector<externalCoordinate>& e);
		public:
			///Construct an axis dividing a range into uniform bins
			///\param count the number of bins
			///\param limits the lower and upper limits of the axis
			///\param label descriptive name for the axis
			///\throws typeError if no limits are given
			///\throws validationError if count is less than one, or limits are not an increasing pair
			axis(int count, const std::vector<externalCoordinate>& limits, std::string label="");

			///Construct an axis from an explicit list of bin edges, which is copied
			///\throws validationError if the edges are not strictly increasing or there are fewer than two
			explicit axis(std::vector<externalCoordinate> edges, std::string label="");

			const std::vector<externalCoordinate>& getEdges() const{ return(edges); }
			///Replace all edges of the axis. The new edges are validated just as at construction.
			void setEdges(std::vector<externalCoordinate> newEdges);

			const std::string& getLabel() const{ return(label); }
			void setLabel(std::string newLabel){ label=std::move(newLabel); }

			unsigned int numBins() const{ return(edges.size()-1); }
			externalCoordinate min() const{ return(edges.front()); }
			externalCoordinate max() const{ return(edges.back()); }
			std::pair<externalCoordinate,externalCoordinate> limits() const{
				return(std::make_pair(edges.front(),edges.back()));
			}
			///A coordinate which is guaranteed to lie above the range of the axis
			externalCoordinate overflow() const{ return(edges.back()+1); }

			///gets the smallest external coordinate which falls in the given bin
			externalCoordinate getBinEdge(unsigned int bin) const{ return(edges[bin]); }
			///gets the central external coordinate of the given bin
			externalCoordinate getBinCenter(unsigned int bin) const{ return((edges[bin]+edges[bin+1])/2); }
			///gets the width of the given bin (by default the second bin)
			///\throws validationError if the axis has no such bin
			externalCoordinate getBinWidth(unsigned int bin=1) const;

			std::vector<externalCoordinate> binWidths() const;
			std::vector<externalCoordinate> binCenters() const;

			///whether x lies inside the range [min, max)
			bool inAxis(externalCoordinate x) const;

			///\brief finds the bin containing x.
			///\return the index of the bin, or a negative number if x is below the first edge,
			///        or numBins() if x is at or beyond the last edge (or is NaN)
			internalCoordinate findBin(externalCoordinate x) const;

			///\brief finds the index of an edge near x, clamped to [0, numBins()].
			///\param snap one of SNAP_NEAREST, SNAP_LOW, or SNAP_HIGH. SNAP_NEAREST chooses the
			///            upper edge only when it is strictly closer than the lower edge.
			///\throws validationError for any other snap mode
			unsigned int edgeIndex(externalCoordinate x, snapMode snap=SNAP_NEAREST) const;
			///finds the indices of both edges bounding the bin containing x, each clamped to [0, numBins()]
			std::pair<unsigned int,unsigned int> edgeIndices(externalCoordinate x) const;

			///\brief whether all bins have the same width.
			///All widths must be within atol + rtol*|median| of the median width.
			bool isUniform(double rtol=1e-5, double atol=1e-8) const;

			///\brief Restrict the axis to a subrange.
			///\param low the lowest coordinate which should be included, or none to keep the first edge
			///\param high the highest coordinate which should be included, or none to keep the last edge
			///\param lowSnap how the lower boundary is chosen: SNAP_NEAREST, SNAP_LOW, SNAP_HIGH,
			///               SNAP_EXPAND, or SNAP_CLIP
			///\param highSnap how the upper boundary is chosen
			///\return the new axis, and a mask over the bins of this axis which is true for bins retained
			std::pair<axis,std::vector<bool>> cut(boost::optional<externalCoordinate> low,
			                                      boost::optional<externalCoordinate> high,
			                                      snapMode lowSnap, snapMode highSnap) const;
			///Restrict the axis to a subrange, using the same snapping for both boundaries
			std::pair<axis,std::vector<bool>> cut(boost::optional<externalCoordinate> low,
			                                      boost::optional<externalCoordinate> high=boost::none,
			                                      snapMode snap=SNAP_NEAREST) const{
				return(cut(low,high,snap,snap));
			}

			///\brief Computes which of this axis's edges survive merging groups of n bins.
			///
			///The surviving edges delimit the merged bins, so this also describes which
			///original bins are combined into each new bin.
			///\param n the number of consecutive bins to group together
			///\param snap SNAP_LOW to drop any remainder from the high end, SNAP_HIGH to drop it from the low end
			///\param clip whether to discard a leftover partial group; if false it is kept as one narrower bin
			std::vector<unsigned int> mergedEdgeIndices(unsigned int n, snapMode snap=SNAP_LOW, bool clip=true) const;

			///Construct a new axis by merging groups of n consecutive bins
			///\see mergedEdgeIndices
			axis mergeBins(unsigned int n=2, snapMode snap=SNAP_LOW, bool clip=true) const;

			axis clone() const{ return(*this); }

			///Axes are equal if their edges agree within floating point tolerance; labels are ignored
			bool operator==(const axis& other) const;
			bool operator!=(const axis& other) const{ return(!(*this==other)); }
		};

		std::ostream& operator<<(std::ostream& os, const axis& a);

		///An axis specified by its explicit bin edges
		struct edgeList{
			std::vector<double> edges;
			std::string label;
		};

		///An axis specified by a number of uniform bins over a range
		struct uniformBinning{
			int count;
			std::vector<double> limits;
			std::string label;
		};

		///Any of the inputs from which an axis may be built
		typedef boost::variant<edgeList,uniformBinning,axis> axisSpec;

		///Build the axis described by an axisSpec
		axis makeAxis(const axisSpec& spec);

	} //namespace histograms
} //namespace grid_hist

#endif //GRIDHIST_AXIS_H
