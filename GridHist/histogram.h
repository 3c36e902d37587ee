///\file histogram.h
///This file defines the dense, dynamically dimensioned histogram type, the operations which
///restructure it, and arithmetic between histograms, arrays, and scalars with propagation of
///statistical uncertainties.

#ifndef GRIDHIST_HISTOGRAM_H
#define GRIDHIST_HISTOGRAM_H

#include <array>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "GridHist/axis.h"
#include "GridHist/errors.h"

namespace grid_hist{
	namespace histograms{

		///The kinds of values a histogram may store
		enum dataType{
			INTEGER, ///<only integral values; arithmetic which would produce fractions is refused or promotes
			REAL
		};

		std::string dataTypeName(dataType type);

		///A value together with its standard deviation
		struct valueWithUncertainty{
			double value;
			double uncertainty;
		};

		///Coordinates for drawing a one dimensional histogram as a step function
		struct stepLine{
			std::vector<double> x;
			std::vector<double> y;
			///the bounding box of the points: {xmin, xmax, ymin, ymax}
			std::array<double,4> extent;
		};

		namespace detail{
			template<typename... Specs>
			struct allAxisSpecs;

			template<>
			struct allAxisSpecs<> : std::true_type{};

			template<typename First, typename... Rest>
			struct allAxisSpecs<First,Rest...> : std::integral_constant<bool,
				(std::is_same<First,axis>::value || std::is_same<First,edgeList>::value
				 || std::is_same<First,uniformBinning>::value)
				&& allAxisSpecs<Rest...>::value>{};
		}

		class histogram;

		enum binaryOperation{ADD,SUBTRACT,MULTIPLY,DIVIDE};

		///A single number applied to every bin
		struct scalarOperand{
			double value;
			dataType type;
		};

		///An array of numbers with one entry per bin, in row-major order
		struct arrayOperand{
			std::vector<double> values;
			dataType type;
		};

		typedef boost::variant<scalarOperand,arrayOperand,const histogram*> operand;

		///\brief A dense histogram with an arbitrary number of dimensions.
		///
		///Bin contents are stored in row-major order (the last axis varies fastest).
		///Uncertainties (standard deviations) may optionally be tracked per bin; when they
		///are not, the Poisson estimate sqrt(|content|) is reported on request.
		class histogram{
		private:
			std::vector<axis> axes;
			std::vector<unsigned int> extents;
			std::vector<size_t> strides;
			std::vector<double> data;
			dataType type;
			boost::optional<std::vector<double>> uncert;
			std::string label;
			std::string title;

			void initializeShape();
			///\throws typeError if type is INTEGER and any value is not an integer of magnitude at most 2^53
			void checkStorable(const std::vector<double>& values, const std::string& context) const;
			void checkDimension(unsigned int dim) const;
			std::vector<unsigned int> locate(const std::vector<double>& point) const;

		public:
			///\brief Construct an empty (zero filled, INTEGER) histogram from axis specifications
			///\throws typeError if no axes are specified
			explicit histogram(const std::vector<axisSpec>& specs, std::string label="", std::string title="");

			///\brief Construct an empty histogram from one axis specification per dimension
			template<typename... Specs, typename=typename std::enable_if<detail::allAxisSpecs<Specs...>::value>::type>
			explicit histogram(const Specs&... specs):
			histogram(std::vector<axisSpec>{axisSpec(specs)...}){}

			///\brief Reconstruct a histogram from its complete contents
			///\param axes the axes, one per dimension
			///\param data the bin contents in row-major order
			///\param type the type of the bin contents
			///\param uncert the bin uncertainties in row-major order, if tracked
			///\throws typeError if no axes are given, or if non-integral data are given for INTEGER storage
			///\throws validationError if the sizes of data or uncert do not match the axes
			histogram(std::vector<axis> axes, std::vector<double> data, dataType type,
			          boost::optional<std::vector<double>> uncert=boost::none,
			          std::string label="", std::string title="");

			//------------------------------------------------------------------
			//structure

			unsigned int getDimensions() const{ return(axes.size()); }
			const std::vector<unsigned int>& shape() const{ return(extents); }
			size_t size() const{ return(data.size()); }
			unsigned int getBinCount(unsigned int dim) const;
			const axis& getAxis(unsigned int dim) const;
			const std::vector<axis>& getAxes() const{ return(axes); }
			///Replace the label of one axis; edges cannot be changed in place
			void setAxisLabel(unsigned int dim, std::string newLabel);
			///The edges of every axis
			std::vector<std::vector<double>> edges() const;
			std::vector<double> binCenters(unsigned int dim=0) const;
			std::vector<double> binWidths(unsigned int dim=0) const;
			///the width of one bin of one axis; the default bin index is 1, the second bin
			double getBinWidth(unsigned int bin=1, unsigned int dim=0) const;
			///the product of bin widths over all axes, for every bin
			std::vector<double> binVolumes() const;
			///\brief The bin center coordinates of every bin.
			///\return one row-major array per dimension, each with one entry per bin
			std::vector<std::vector<double>> centerGrid() const;
			///\brief The coordinates of every point of the grid formed by the bin edges.
			///\return one row-major array per dimension, each over a grid one larger than the
			///        histogram in every dimension
			std::vector<std::vector<double>> edgeGrid() const;
			///whether every axis has uniform bins
			bool isUniform(double rtol=1e-5, double atol=1e-8) const;

			//------------------------------------------------------------------
			//contents

			const std::vector<double>& getData() const{ return(data); }
			dataType getDataType() const{ return(type); }
			///Replace all bin contents
			///\throws validationError if the size is wrong
			///\throws typeError if non-integral values are given with type INTEGER
			void setData(std::vector<double> values, dataType newType);
			template<typename T>
			void setData(const std::vector<T>& values){
				static_assert(std::is_arithmetic<T>::value,"Histogram contents must be numbers");
				setData(std::vector<double>(values.begin(),values.end()),
				        std::is_integral<T>::value?INTEGER:REAL);
			}
			template<typename T>
			void setData(std::initializer_list<T> values){
				setData(std::vector<T>(values));
			}

			double binContent(const std::vector<unsigned int>& index) const;
			void setBinContent(const std::vector<unsigned int>& index, double value);

			bool hasUncertainty() const{ return(static_cast<bool>(uncert)); }
			///the uncertainties of all bins; the Poisson estimate if uncertainties are not tracked
			std::vector<double> getUncertainty() const;
			///the tracked uncertainties, if any
			const boost::optional<std::vector<double>>& getStoredUncertainty() const{ return(uncert); }
			///Begin tracking (or replace) per-bin uncertainties
			///\throws validationError if the size is wrong
			void setUncertainty(std::vector<double> values);
			///Stop tracking uncertainties
			void clearUncertainty(){ uncert=boost::none; }

			const std::string& getLabel() const{ return(label); }
			void setLabel(std::string newLabel){ label=std::move(newLabel); }
			const std::string& getTitle() const{ return(title); }
			void setTitle(std::string newTitle){ title=std::move(newTitle); }

			//------------------------------------------------------------------
			//filling

			///\brief Accumulate samples into the histogram.
			///
			///Samples which fall outside the range of any axis are ignored.
			///If uncertainties are tracked each sample's weight is added to its bin's uncertainty in quadrature.
			///\param coordinates one array of sample coordinates per dimension, all of the same length
			///\param weight the weight given to every sample
			///\throws validationError if the number or lengths of the coordinate arrays are wrong
			///\throws typeError if a non-integral weight is given to an INTEGER histogram
			void fill(const std::vector<std::vector<double>>& coordinates, double weight=1);
			///Accumulate samples with individual weights
			void fill(const std::vector<std::vector<double>>& coordinates, const std::vector<double>& weights);
			///\brief Accumulate samples whose weights carry their own uncertainties.
			///
			///This begins tracking uncertainties if they were not already tracked, starting from
			///the Poisson estimate for the existing contents.
			void fill(const std::vector<std::vector<double>>& coordinates, const std::vector<double>& weights,
			          const std::vector<double>& weightUncertainties);
			///Accumulate samples into a one dimensional histogram
			void fill(const std::vector<double>& x, double weight=1);

			///Accumulate a single sample
			void fillOne(const std::vector<double>& point, double weight=1);
			///Accumulate a single sample whose weight has its own uncertainty
			void fillOne(const std::vector<double>& point, double weight, double weightUncertainty);

			///\brief Accumulate samples given as points rather than as per-dimension arrays.
			///\param sample one entry per sample, each holding one coordinate per dimension
			///\throws validationError if any point has the wrong number of coordinates
			void fillFromSample(const std::vector<std::vector<double>>& sample, double weight=1);
			///Accumulate points with individual weights
			void fillFromSample(const std::vector<std::vector<double>>& sample, const std::vector<double>& weights);

			//------------------------------------------------------------------
			//evaluation and summaries

			///\brief Get the content of the bin containing a point
			///\throws validationError if the point is outside the histogram
			double evaluate(const std::vector<double>& point) const;
			template<typename... Coordinates>
			double operator()(Coordinates... coordinates) const{
				return(evaluate(std::vector<double>{static_cast<double>(coordinates)...}));
			}

			///\brief Multilinear interpolation of the contents between bin centers.
			///
			///Points between an outermost bin center and the edge of the axis take the
			///value at that center.
			///\throws validationError if the point is outside the histogram
			double interpolate(const std::vector<double>& point) const;

			///the sum of all bin contents, with uncertainties combined in quadrature
			valueWithUncertainty sum() const;
			///the sum of bin contents multiplied by bin volumes
			valueWithUncertainty integral() const;
			///the smallest bin content, or the smallest content minus uncertainty
			double min(bool withUncertainty=false) const;
			///the largest bin content, or the largest content plus uncertainty
			double max(bool withUncertainty=false) const;
			///\brief the content weighted mean of bin centers along each axis.
			///All entries are NaN if the contents sum to zero.
			std::vector<double> mean() const;
			///the content weighted standard deviation of bin centers along each axis
			std::vector<double> stdDev() const;

			///Replace NaN contents and uncertainties
			void clearNaNs(double value=0);

			///Whether two histograms have equal axes, data, uncertainties, and descriptions
			bool isIdentical(const histogram& other) const;

			//------------------------------------------------------------------
			//bulk modification

			///Zero all contents and stop tracking uncertainties
			void reset();
			///\brief Set all bin contents to the same value
			///\throws typeError if value is not integral and the histogram is INTEGER
			void set(double value);
			///Set all bin contents and uncertainties
			void set(double value, double uncertainty);

			///Deep copy
			histogram clone() const{ return(*this); }
			///Deep copy with conversion to a different type; conversion to INTEGER truncates toward zero
			histogram clone(dataType newType) const;

			//------------------------------------------------------------------
			//restructuring

			///\brief Restrict the histogram along one axis.
			///\see axis::cut
			histogram cut(boost::optional<double> low, boost::optional<double> high, unsigned int dim,
			              snapMode lowSnap, snapMode highSnap) const;
			histogram cut(boost::optional<double> low, boost::optional<double> high=boost::none,
			              unsigned int dim=0, snapMode snap=SNAP_NEAREST) const{
				return(cut(low,high,dim,snap,snap));
			}

			///\brief Merge groups of n consecutive bins along one axis.
			///
			///Contents of merged bins are summed and uncertainties added in quadrature.
			///Bins dropped from the axis are dropped from the contents.
			///\see axis::mergedEdgeIndices
			histogram rebin(unsigned int n=2, unsigned int dim=0, snapMode snap=SNAP_LOW, bool clip=true) const;

			///\brief Extract the histogram of one less dimension formed by a single bin of one axis
			///\throws validationError if this histogram has only one dimension
			histogram extractSlice(unsigned int dim, unsigned int bin) const;
			///Extract every slice along one axis
			std::vector<histogram> slices(unsigned int dim=0) const;

			///\brief Sum out the given dimensions.
			///\throws validationError if every dimension would be removed
			histogram sumOverAxes(std::vector<unsigned int> dims) const;
			///\brief Sum out every dimension except one, producing a one dimensional histogram
			histogram projection(unsigned int dim) const;

			///\brief Histogram the bin contents of this histogram.
			///\param bins the number of uniform bins into which to sort the contents
			///\param range the (low, high) range of contents covered
			///\return a one dimensional INTEGER histogram counting the bins whose contents fall in each range
			histogram occupancy(unsigned int bins, const std::vector<double>& range) const;

			///\brief Coordinates for drawing a one dimensional histogram as a step function.
			///
			///A bin is included if its lower edge is at or above xlow and its upper edge is below xhigh.
			///\throws validationError if the histogram is not one dimensional or no bins are included
			stepLine asLine(boost::optional<double> xlow=boost::none, boost::optional<double> xhigh=boost::none) const;
			///\brief The step line closed into a polygon down to ymin.
			///The default ymin is the smaller of zero and the lowest content.
			stepLine asPolygon(boost::optional<double> ymin=boost::none, boost::optional<double> xlow=boost::none,
			                   boost::optional<double> xhigh=boost::none) const;
		};

		std::ostream& operator<<(std::ostream& os, const histogram& h);

		//----------------------------------------------------------------------
		//arithmetic

		///\brief Combine a histogram with another operand, producing a new histogram.
		///
		///Division yields REAL contents, as does any operation with a REAL operand.
		///Bins divided by zero have content zero.
		///Uncertainties are propagated if either operand is a histogram which tracks them:
		///in quadrature for addition and subtraction, and as relative uncertainties in quadrature
		///for multiplication and division. Histograms which do not track uncertainties contribute
		///their Poisson estimates, while scalars and arrays are treated as exact.
		///\param reflected if true the operand is the left hand side of the operation
		///\throws validationError if array sizes or histogram axes do not match
		histogram applyBinaryOperation(binaryOperation op, const histogram& h, const operand& other, bool reflected=false);

		///\brief Combine a histogram in place with another operand, keeping its axes.
		///
		///Division by a scalar or array converts INTEGER contents to REAL.
		///\throws typeError if h is INTEGER and the result would not be, including division by a histogram
		///\throws validationError if array sizes or histogram axes do not match
		void applyBinaryOperationInPlace(binaryOperation op, histogram& h, const operand& other);

		namespace detail{
			template<typename T>
			scalarOperand makeOperand(T value){
				return(scalarOperand{static_cast<double>(value),std::is_integral<T>::value?INTEGER:REAL});
			}
			template<typename T>
			arrayOperand makeOperand(const std::vector<T>& values){
				return(arrayOperand{std::vector<double>(values.begin(),values.end()),
				                    std::is_integral<T>::value?INTEGER:REAL});
			}
		}

#define GRIDHIST_DEFINE_BINARY_OPERATOR(symbol,operation) \
		inline histogram operator symbol(const histogram& h1, const histogram& h2){ \
			return(applyBinaryOperation(operation,h1,operand(&h2))); \
		} \
		template<typename T, typename=typename std::enable_if<std::is_arithmetic<T>::value>::type> \
		histogram operator symbol(const histogram& h, T value){ \
			return(applyBinaryOperation(operation,h,operand(detail::makeOperand(value)))); \
		} \
		template<typename T, typename=typename std::enable_if<std::is_arithmetic<T>::value>::type> \
		histogram operator symbol(T value, const histogram& h){ \
			return(applyBinaryOperation(operation,h,operand(detail::makeOperand(value)),true)); \
		} \
		template<typename T> \
		histogram operator symbol(const histogram& h, const std::vector<T>& values){ \
			return(applyBinaryOperation(operation,h,operand(detail::makeOperand(values)))); \
		} \
		template<typename T> \
		histogram operator symbol(const std::vector<T>& values, const histogram& h){ \
			return(applyBinaryOperation(operation,h,operand(detail::makeOperand(values)),true)); \
		} \
		inline histogram& operator symbol##=(histogram& h1, const histogram& h2){ \
			applyBinaryOperationInPlace(operation,h1,operand(&h2)); \
			return(h1); \
		} \
		template<typename T, typename=typename std::enable_if<std::is_arithmetic<T>::value>::type> \
		histogram& operator symbol##=(histogram& h, T value){ \
			applyBinaryOperationInPlace(operation,h,operand(detail::makeOperand(value))); \
			return(h); \
		} \
		template<typename T> \
		histogram& operator symbol##=(histogram& h, const std::vector<T>& values){ \
			applyBinaryOperationInPlace(operation,h,operand(detail::makeOperand(values))); \
			return(h); \
		}

		GRIDHIST_DEFINE_BINARY_OPERATOR(+,ADD)
		GRIDHIST_DEFINE_BINARY_OPERATOR(-,SUBTRACT)
		GRIDHIST_DEFINE_BINARY_OPERATOR(*,MULTIPLY)
		GRIDHIST_DEFINE_BINARY_OPERATOR(/,DIVIDE)

#undef GRIDHIST_DEFINE_BINARY_OPERATOR

	} //namespace histograms
} //namespace grid_hist

#endif //GRIDHIST_HISTOGRAM_H
