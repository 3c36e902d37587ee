#include "GridHist/histogram.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <ostream>

#include "GridHist/detail/grid_index.h"

namespace grid_hist{
	namespace histograms{

		std::string dataTypeName(dataType type){
			switch(type){
				case INTEGER: return("integer");
				case REAL: return("real");
			}
			throw validationError("Invalid data type: "+std::to_string(static_cast<int>(type)));
		}

		namespace{
			///the largest magnitude up to which every integer is exactly representable as a double
			const double maxExactInteger=9007199254740992.0; //2^53

			bool isIntegral(double value){
				return(std::isfinite(value) && std::trunc(value)==value && std::abs(value)<=maxExactInteger);
			}
		}

		histogram::histogram(const std::vector<axisSpec>& specs, std::string label, std::string title):
		type(INTEGER),label(std::move(label)),title(std::move(title)){
			if(specs.empty())
				throw typeError("A histogram requires at least one axis");
			axes.reserve(specs.size());
			for(const axisSpec& spec : specs)
				axes.push_back(makeAxis(spec));
			initializeShape();
			data.assign(detail::elementCount(extents),0.0);
		}

		histogram::histogram(std::vector<axis> axes, std::vector<double> data, dataType type,
		                     boost::optional<std::vector<double>> uncert,
		                     std::string label, std::string title):
		axes(std::move(axes)),type(type),label(std::move(label)),title(std::move(title)){
			if(this->axes.empty())
				throw typeError("A histogram requires at least one axis");
			initializeShape();
			setData(std::move(data),type);
			if(uncert)
				setUncertainty(std::move(*uncert));
		}

		void histogram::initializeShape(){
			extents.resize(axes.size());
			for(size_t i=0; i<axes.size(); i++)
				extents[i]=axes[i].numBins();
			strides=detail::rowMajorStrides(extents);
		}

		void histogram::checkStorable(const std::vector<double>& values, const std::string& context) const{
			if(type!=INTEGER)
				return;
			for(double v : values){
				if(!isIntegral(v))
					throw typeError("Cannot store non-integral or out of range value "+std::to_string(v)+
					                " in an integer histogram ("+context+")");
			}
		}

		void histogram::checkDimension(unsigned int dim) const{
			if(dim>=axes.size())
				throw validationError("Dimension "+std::to_string(dim)+" out of range for a histogram with "
				                      +std::to_string(axes.size())+" dimensions");
		}

		unsigned int histogram::getBinCount(unsigned int dim) const{
			checkDimension(dim);
			return(extents[dim]);
		}

		const axis& histogram::getAxis(unsigned int dim) const{
			checkDimension(dim);
			return(axes[dim]);
		}

		void histogram::setAxisLabel(unsigned int dim, std::string newLabel){
			checkDimension(dim);
			axes[dim].setLabel(std::move(newLabel));
		}

		std::vector<std::vector<double>> histogram::edges() const{
			std::vector<std::vector<double>> result;
			result.reserve(axes.size());
			for(const axis& a : axes)
				result.push_back(a.getEdges());
			return(result);
		}

		std::vector<double> histogram::binCenters(unsigned int dim) const{
			return(getAxis(dim).binCenters());
		}

		std::vector<double> histogram::binWidths(unsigned int dim) const{
			return(getAxis(dim).binWidths());
		}

		double histogram::getBinWidth(unsigned int bin, unsigned int dim) const{
			return(getAxis(dim).getBinWidth(bin));
		}

		std::vector<double> histogram::binVolumes() const{
			std::vector<double> volumes(data.size(),1.0);
			std::vector<unsigned int> index(axes.size(),0);
			size_t i=0;
			do{
				for(size_t d=0; d<axes.size(); d++)
					volumes[i]*=axes[d].getBinWidth(index[d]);
				i++;
			}while(detail::advanceIndex(index,extents));
			return(volumes);
		}

		std::vector<std::vector<double>> histogram::centerGrid() const{
			std::vector<std::vector<double>> grid(axes.size());
			std::vector<unsigned int> index(axes.size(),0);
			do{
				for(size_t d=0; d<axes.size(); d++)
					grid[d].push_back(axes[d].getBinCenter(index[d]));
			}while(detail::advanceIndex(index,extents));
			return(grid);
		}

		std::vector<std::vector<double>> histogram::edgeGrid() const{
			std::vector<unsigned int> edgeCounts(extents);
			for(unsigned int& n : edgeCounts)
				n++;
			std::vector<std::vector<double>> grid(axes.size());
			std::vector<unsigned int> index(axes.size(),0);
			do{
				for(size_t d=0; d<axes.size(); d++)
					grid[d].push_back(axes[d].getBinEdge(index[d]));
			}while(detail::advanceIndex(index,edgeCounts));
			return(grid);
		}

		bool histogram::isUniform(double rtol, double atol) const{
			for(const axis& a : axes){
				if(!a.isUniform(rtol,atol))
					return(false);
			}
			return(true);
		}

		void histogram::setData(std::vector<double> values, dataType newType){
			if(values.size()!=detail::elementCount(extents))
				throw validationError("Data size "+std::to_string(values.size())+" does not match histogram size "
				                      +std::to_string(detail::elementCount(extents)));
			dataType oldType=type;
			type=newType;
			try{
				checkStorable(values,"setData");
			}catch(...){
				type=oldType;
				throw;
			}
			data=std::move(values);
		}

		double histogram::binContent(const std::vector<unsigned int>& index) const{
			if(index.size()!=axes.size())
				throw validationError("Bin index has "+std::to_string(index.size())+" components, histogram has "
				                      +std::to_string(axes.size())+" dimensions");
			for(size_t d=0; d<index.size(); d++){
				if(index[d]>=extents[d])
					throw validationError("Bin index "+std::to_string(index[d])+" out of range in dimension "+std::to_string(d));
			}
			return(data[detail::flatten(index,strides)]);
		}

		void histogram::setBinContent(const std::vector<unsigned int>& index, double value){
			binContent(index); //validates the index
			checkStorable(std::vector<double>{value},"setBinContent");
			data[detail::flatten(index,strides)]=value;
		}

		std::vector<double> histogram::getUncertainty() const{
			if(uncert)
				return(*uncert);
			std::vector<double> poisson(data.size());
			for(size_t i=0; i<data.size(); i++)
				poisson[i]=std::sqrt(std::abs(data[i]));
			return(poisson);
		}

		void histogram::setUncertainty(std::vector<double> values){
			if(values.size()!=data.size())
				throw validationError("Uncertainty size "+std::to_string(values.size())+
				                      " does not match histogram size "+std::to_string(data.size()));
			uncert=std::move(values);
		}

		//------------------------------------------------------------------
		//filling

		void histogram::fill(const std::vector<std::vector<double>>& coordinates, double weight){
			size_t n=(coordinates.empty() ? 0 : coordinates.front().size());
			fill(coordinates,std::vector<double>(n,weight));
		}

		void histogram::fill(const std::vector<std::vector<double>>& coordinates, const std::vector<double>& weights){
			if(coordinates.size()!=axes.size())
				throw validationError("Got "+std::to_string(coordinates.size())+" coordinate arrays for a histogram with "
				                      +std::to_string(axes.size())+" dimensions");
			const size_t n=coordinates.front().size();
			for(const std::vector<double>& c : coordinates){
				if(c.size()!=n)
					throw validationError("Coordinate arrays must all have the same length");
			}
			if(weights.size()!=n)
				throw validationError("Got "+std::to_string(weights.size())+" weights for "+std::to_string(n)+" samples");
			checkStorable(weights,"fill weights");

			std::vector<double> point(axes.size());
			for(size_t i=0; i<n; i++){
				for(size_t d=0; d<axes.size(); d++)
					point[d]=coordinates[d][i];
				std::vector<unsigned int> index=locate(point);
				if(index.empty())
					continue;
				size_t cell=detail::flatten(index,strides);
				data[cell]+=weights[i];
				if(uncert)
					(*uncert)[cell]=std::sqrt((*uncert)[cell]*(*uncert)[cell]+weights[i]*weights[i]);
			}
		}

		void histogram::fill(const std::vector<std::vector<double>>& coordinates, const std::vector<double>& weights,
		                     const std::vector<double>& weightUncertainties){
			if(weightUncertainties.size()!=weights.size())
				throw validationError("Got "+std::to_string(weightUncertainties.size())+" weight uncertainties for "
				                      +std::to_string(weights.size())+" weights");
			if(coordinates.size()!=axes.size())
				throw validationError("Got "+std::to_string(coordinates.size())+" coordinate arrays for a histogram with "
				                      +std::to_string(axes.size())+" dimensions");
			const size_t n=coordinates.front().size();
			for(const std::vector<double>& c : coordinates){
				if(c.size()!=n)
					throw validationError("Coordinate arrays must all have the same length");
			}
			if(weights.size()!=n)
				throw validationError("Got "+std::to_string(weights.size())+" weights for "+std::to_string(n)+" samples");
			checkStorable(weights,"fill weights");

			if(!uncert)
				uncert=getUncertainty();
			std::vector<double>& u=*uncert;
			std::vector<double> point(axes.size());
			for(size_t i=0; i<n; i++){
				for(size_t d=0; d<axes.size(); d++)
					point[d]=coordinates[d][i];
				std::vector<unsigned int> index=locate(point);
				if(index.empty())
					continue;
				size_t cell=detail::flatten(index,strides);
				data[cell]+=weights[i];
				u[cell]=std::sqrt(u[cell]*u[cell]+weightUncertainties[i]*weightUncertainties[i]);
			}
		}

		void histogram::fill(const std::vector<double>& x, double weight){
			fill(std::vector<std::vector<double>>{x},weight);
		}

		void histogram::fillOne(const std::vector<double>& point, double weight){
			std::vector<std::vector<double>> coordinates;
			for(double x : point)
				coordinates.push_back(std::vector<double>{x});
			fill(coordinates,std::vector<double>{weight});
		}

		void histogram::fillOne(const std::vector<double>& point, double weight, double weightUncertainty){
			std::vector<std::vector<double>> coordinates;
			for(double x : point)
				coordinates.push_back(std::vector<double>{x});
			fill(coordinates,std::vector<double>{weight},std::vector<double>{weightUncertainty});
		}

		namespace{
			std::vector<std::vector<double>> transposeSample(const std::vector<std::vector<double>>& sample, size_t dims){
				std::vector<std::vector<double>> coordinates(dims);
				for(std::vector<double>& c : coordinates)
					c.reserve(sample.size());
				for(size_t i=0; i<sample.size(); i++){
					if(sample[i].size()!=dims)
						throw validationError("Sample point "+std::to_string(i)+" has "+std::to_string(sample[i].size())
						                      +" coordinates, histogram has "+std::to_string(dims)+" dimensions");
					for(size_t d=0; d<dims; d++)
						coordinates[d].push_back(sample[i][d]);
				}
				return(coordinates);
			}
		}

		void histogram::fillFromSample(const std::vector<std::vector<double>>& sample, double weight){
			fill(transposeSample(sample,axes.size()),std::vector<double>(sample.size(),weight));
		}

		void histogram::fillFromSample(const std::vector<std::vector<double>>& sample, const std::vector<double>& weights){
			fill(transposeSample(sample,axes.size()),weights);
		}

		///\return the bin index of the point, or an empty index if it lies outside the histogram
		std::vector<unsigned int> histogram::locate(const std::vector<double>& point) const{
			if(point.size()!=axes.size())
				throw validationError("Point has "+std::to_string(point.size())+" coordinates, histogram has "
				                      +std::to_string(axes.size())+" dimensions");
			std::vector<unsigned int> index(axes.size());
			for(size_t d=0; d<axes.size(); d++){
				axis::internalCoordinate bin=axes[d].findBin(point[d]);
				if(bin<0 || bin>=static_cast<axis::internalCoordinate>(extents[d]))
					return(std::vector<unsigned int>());
				index[d]=bin;
			}
			return(index);
		}

		//------------------------------------------------------------------
		//evaluation and summaries

		double histogram::evaluate(const std::vector<double>& point) const{
			std::vector<unsigned int> index=locate(point);
			if(index.empty())
				throw validationError("Point is outside of the histogram");
			return(data[detail::flatten(index,strides)]);
		}

		double histogram::interpolate(const std::vector<double>& point) const{
			if(locate(point).empty())
				throw validationError("Point is outside of the histogram");
			const size_t dims=axes.size();
			//for each dimension, the two neighboring bins and the weight of the upper one
			std::vector<unsigned int> lower(dims), upper(dims);
			std::vector<double> fraction(dims);
			for(size_t d=0; d<dims; d++){
				const axis& a=axes[d];
				const unsigned int nb=extents[d];
				double x=point[d];
				if(nb==1 || x<=a.getBinCenter(0)){
					lower[d]=upper[d]=0;
					fraction[d]=0;
				}
				else if(x>=a.getBinCenter(nb-1)){
					lower[d]=upper[d]=nb-1;
					fraction[d]=0;
				}
				else{
					unsigned int bin=a.findBin(x);
					if(x<a.getBinCenter(bin))
						bin--;
					lower[d]=bin;
					upper[d]=bin+1;
					double c0=a.getBinCenter(bin), c1=a.getBinCenter(bin+1);
					fraction[d]=(x-c0)/(c1-c0);
				}
			}
			//sum over the corners of the enclosing cell
			double result=0;
			std::vector<unsigned int> corner(dims);
			for(unsigned long mask=0; mask<(1UL<<dims); mask++){
				double weight=1;
				for(size_t d=0; d<dims; d++){
					bool high=(mask>>d)&1;
					corner[d]=(high?upper[d]:lower[d]);
					weight*=(high?fraction[d]:1-fraction[d]);
				}
				if(weight!=0)
					result+=weight*data[detail::flatten(corner,strides)];
			}
			return(result);
		}

		valueWithUncertainty histogram::sum() const{
			valueWithUncertainty result{0,0};
			std::vector<double> u=getUncertainty();
			for(size_t i=0; i<data.size(); i++){
				result.value+=data[i];
				result.uncertainty+=u[i]*u[i];
			}
			result.uncertainty=std::sqrt(result.uncertainty);
			return(result);
		}

		valueWithUncertainty histogram::integral() const{
			valueWithUncertainty result{0,0};
			std::vector<double> u=getUncertainty();
			std::vector<double> volumes=binVolumes();
			for(size_t i=0; i<data.size(); i++){
				result.value+=data[i]*volumes[i];
				result.uncertainty+=u[i]*u[i]*volumes[i]*volumes[i];
			}
			result.uncertainty=std::sqrt(result.uncertainty);
			return(result);
		}

		double histogram::min(bool withUncertainty) const{
			std::vector<double> u;
			if(withUncertainty)
				u=getUncertainty();
			double result=std::numeric_limits<double>::infinity();
			for(size_t i=0; i<data.size(); i++)
				result=std::min(result,withUncertainty?data[i]-u[i]:data[i]);
			return(result);
		}

		double histogram::max(bool withUncertainty) const{
			std::vector<double> u;
			if(withUncertainty)
				u=getUncertainty();
			double result=-std::numeric_limits<double>::infinity();
			for(size_t i=0; i<data.size(); i++)
				result=std::max(result,withUncertainty?data[i]+u[i]:data[i]);
			return(result);
		}

		std::vector<double> histogram::mean() const{
			const size_t dims=axes.size();
			std::vector<double> total(dims,0.0);
			double weightSum=0;
			std::vector<unsigned int> index(dims,0);
			size_t i=0;
			do{
				for(size_t d=0; d<dims; d++)
					total[d]+=data[i]*axes[d].getBinCenter(index[d]);
				weightSum+=data[i];
				i++;
			}while(detail::advanceIndex(index,extents));
			for(size_t d=0; d<dims; d++)
				total[d]=(weightSum!=0 ? total[d]/weightSum : std::numeric_limits<double>::quiet_NaN());
			return(total);
		}

		std::vector<double> histogram::stdDev() const{
			const size_t dims=axes.size();
			std::vector<double> centers=mean();
			std::vector<double> total(dims,0.0);
			double weightSum=0;
			std::vector<unsigned int> index(dims,0);
			size_t i=0;
			do{
				for(size_t d=0; d<dims; d++){
					double dx=axes[d].getBinCenter(index[d])-centers[d];
					total[d]+=data[i]*dx*dx;
				}
				weightSum+=data[i];
				i++;
			}while(detail::advanceIndex(index,extents));
			for(size_t d=0; d<dims; d++)
				total[d]=(weightSum!=0 ? std::sqrt(total[d]/weightSum) : std::numeric_limits<double>::quiet_NaN());
			return(total);
		}

		void histogram::clearNaNs(double value){
			checkStorable(std::vector<double>{value},"clearNaNs");
			for(double& d : data){
				if(std::isnan(d))
					d=value;
			}
			if(uncert){
				for(double& u : *uncert){
					if(std::isnan(u))
						u=value;
				}
			}
		}

		bool histogram::isIdentical(const histogram& other) const{
			if(axes.size()!=other.axes.size())
				return(false);
			for(size_t d=0; d<axes.size(); d++){
				if(axes[d]!=other.axes[d] || axes[d].getLabel()!=other.axes[d].getLabel())
					return(false);
			}
			return(type==other.type && data==other.data && uncert==other.uncert
			       && label==other.label && title==other.title);
		}

		//------------------------------------------------------------------
		//bulk modification

		void histogram::reset(){
			std::fill(data.begin(),data.end(),0.0);
			uncert=boost::none;
		}

		void histogram::set(double value){
			checkStorable(std::vector<double>{value},"set");
			std::fill(data.begin(),data.end(),value);
		}

		void histogram::set(double value, double uncertainty){
			set(value);
			uncert=std::vector<double>(data.size(),uncertainty);
		}

		histogram histogram::clone(dataType newType) const{
			histogram result(*this);
			result.type=newType;
			if(newType==INTEGER && type!=INTEGER){
				for(double& d : result.data)
					d=std::trunc(d);
				result.checkStorable(result.data,"clone");
			}
			return(result);
		}

		std::ostream& operator<<(std::ostream& os, const histogram& h){
			const std::vector<double>& data=h.getData();
			const std::vector<unsigned int>& shape=h.shape();
			std::vector<unsigned int> index(shape.size(),0);
			size_t i=0;
			do{
				for(size_t d=0; d<shape.size(); d++)
					os << h.getAxis(d).getBinEdge(index[d]) << ' ';
				os << data[i] << '\n';
				if(index.back()==shape.back()-1)
					os << '\n';
				i++;
			}while(detail::advanceIndex(index,shape));
			return(os);
		}

	} //namespace histograms
} //namespace grid_hist
