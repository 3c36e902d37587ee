#include "GridHist/histogram.h"

#include <algorithm>
#include <cmath>

#include "GridHist/detail/grid_index.h"

namespace grid_hist{
	namespace histograms{

		namespace{
			///\brief Builds a histogram whose bins along one dimension are sums of groups of the original bins.
			///\param target for each original bin along dim, the new bin it is added to, or -1 to drop it
			histogram regroup(const histogram& h, unsigned int dim, const std::vector<int>& target, axis newAxis){
				std::vector<axis> newAxes=h.getAxes();
				newAxes[dim]=std::move(newAxis);
				std::vector<unsigned int> newShape=h.shape();
				newShape[dim]=newAxes[dim].numBins();
				std::vector<size_t> newStrides=detail::rowMajorStrides(newShape);

				const std::vector<double>& data=h.getData();
				std::vector<double> newData(detail::elementCount(newShape),0.0);
				const bool tracked=h.hasUncertainty();
				std::vector<double> newUncert;
				if(tracked)
					newUncert.assign(newData.size(),0.0);

				std::vector<unsigned int> index(h.getDimensions(),0);
				size_t i=0;
				do{
					int dest=target[index[dim]];
					if(dest>=0){
						unsigned int original=index[dim];
						index[dim]=dest;
						size_t cell=detail::flatten(index,newStrides);
						index[dim]=original;
						newData[cell]+=data[i];
						if(tracked){
							double u=(*h.getStoredUncertainty())[i];
							newUncert[cell]+=u*u;
						}
					}
					i++;
				}while(detail::advanceIndex(index,h.shape()));

				boost::optional<std::vector<double>> uncert;
				if(tracked){
					for(double& u : newUncert)
						u=std::sqrt(u);
					uncert=std::move(newUncert);
				}
				return(histogram(std::move(newAxes),std::move(newData),h.getDataType(),std::move(uncert),
				                 h.getLabel(),h.getTitle()));
			}
		}

		histogram histogram::cut(boost::optional<double> low, boost::optional<double> high, unsigned int dim,
		                         snapMode lowSnap, snapMode highSnap) const{
			checkDimension(dim);
			std::pair<axis,std::vector<bool>> restricted=axes[dim].cut(low,high,lowSnap,highSnap);
			std::vector<int> target(extents[dim],-1);
			int next=0;
			for(unsigned int i=0; i<extents[dim]; i++){
				if(restricted.second[i])
					target[i]=next++;
			}
			return(regroup(*this,dim,target,std::move(restricted.first)));
		}

		histogram histogram::rebin(unsigned int n, unsigned int dim, snapMode snap, bool clip) const{
			checkDimension(dim);
			std::vector<unsigned int> kept=axes[dim].mergedEdgeIndices(n,snap,clip);
			std::vector<int> target(extents[dim],-1);
			for(size_t g=0; g+1<kept.size(); g++){
				for(unsigned int i=kept[g]; i<kept[g+1]; i++)
					target[i]=g;
			}
			return(regroup(*this,dim,target,axes[dim].mergeBins(n,snap,clip)));
		}

		histogram histogram::extractSlice(unsigned int dim, unsigned int bin) const{
			checkDimension(dim);
			if(axes.size()<2)
				throw validationError("Cannot slice a one dimensional histogram");
			if(bin>=extents[dim])
				throw validationError("Bin "+std::to_string(bin)+" out of range for slicing dimension "+std::to_string(dim));

			std::vector<axis> newAxes;
			for(unsigned int d=0; d<axes.size(); d++){
				if(d!=dim)
					newAxes.push_back(axes[d]);
			}
			std::vector<double> newData;
			std::vector<double> newUncert;
			newData.reserve(data.size()/extents[dim]);

			std::vector<unsigned int> index(axes.size(),0);
			size_t i=0;
			do{
				if(index[dim]==bin){
					newData.push_back(data[i]);
					if(uncert)
						newUncert.push_back((*uncert)[i]);
				}
				i++;
			}while(detail::advanceIndex(index,extents));

			boost::optional<std::vector<double>> sliceUncert;
			if(uncert)
				sliceUncert=std::move(newUncert);
			return(histogram(std::move(newAxes),std::move(newData),type,std::move(sliceUncert),label,title));
		}

		std::vector<histogram> histogram::slices(unsigned int dim) const{
			checkDimension(dim);
			std::vector<histogram> result;
			result.reserve(extents[dim]);
			for(unsigned int bin=0; bin<extents[dim]; bin++)
				result.push_back(extractSlice(dim,bin));
			return(result);
		}

		histogram histogram::sumOverAxes(std::vector<unsigned int> dims) const{
			std::sort(dims.begin(),dims.end());
			dims.erase(std::unique(dims.begin(),dims.end()),dims.end());
			for(unsigned int d : dims)
				checkDimension(d);
			if(dims.size()>=axes.size())
				throw validationError("Cannot sum over every axis of a histogram; use sum() instead");

			std::vector<bool> removed(axes.size(),false);
			for(unsigned int d : dims)
				removed[d]=true;
			std::vector<axis> newAxes;
			std::vector<unsigned int> newShape;
			for(unsigned int d=0; d<axes.size(); d++){
				if(!removed[d]){
					newAxes.push_back(axes[d]);
					newShape.push_back(extents[d]);
				}
			}
			std::vector<size_t> newStrides=detail::rowMajorStrides(newShape);
			std::vector<double> newData(detail::elementCount(newShape),0.0);
			std::vector<double> newUncert;
			if(uncert)
				newUncert.assign(newData.size(),0.0);

			std::vector<unsigned int> index(axes.size(),0);
			std::vector<unsigned int> newIndex(newAxes.size());
			size_t i=0;
			do{
				for(unsigned int d=0, k=0; d<axes.size(); d++){
					if(!removed[d])
						newIndex[k++]=index[d];
				}
				size_t cell=detail::flatten(newIndex,newStrides);
				newData[cell]+=data[i];
				if(uncert)
					newUncert[cell]+=(*uncert)[i]*(*uncert)[i];
				i++;
			}while(detail::advanceIndex(index,extents));

			boost::optional<std::vector<double>> summedUncert;
			if(uncert){
				for(double& u : newUncert)
					u=std::sqrt(u);
				summedUncert=std::move(newUncert);
			}
			return(histogram(std::move(newAxes),std::move(newData),type,std::move(summedUncert),label,title));
		}

		histogram histogram::projection(unsigned int dim) const{
			checkDimension(dim);
			std::vector<unsigned int> others;
			for(unsigned int d=0; d<axes.size(); d++){
				if(d!=dim)
					others.push_back(d);
			}
			return(sumOverAxes(others));
		}

		histogram histogram::occupancy(unsigned int bins, const std::vector<double>& range) const{
			axis valueAxis(static_cast<int>(bins),range,label);
			std::vector<double> counts(bins,0.0);
			for(double value : data){
				axis::internalCoordinate bin=valueAxis.findBin(value);
				if(bin>=0 && bin<static_cast<axis::internalCoordinate>(bins))
					counts[bin]+=1;
			}
			return(histogram(std::vector<axis>{valueAxis},std::move(counts),INTEGER,boost::none,
			                 "",title));
		}

		stepLine histogram::asLine(boost::optional<double> xlow, boost::optional<double> xhigh) const{
			if(axes.size()!=1)
				throw validationError("Only one dimensional histograms can be drawn as lines (this one has "
				                      +std::to_string(axes.size())+" dimensions)");
			const std::vector<double>& binEdges=axes.front().getEdges();
			stepLine line;
			for(unsigned int i=0; i<extents.front(); i++){
				if(xlow && binEdges[i]<*xlow)
					continue;
				if(xhigh && !(binEdges[i+1]<*xhigh))
					continue;
				line.x.push_back(binEdges[i]);
				line.x.push_back(binEdges[i+1]);
				line.y.push_back(data[i]);
				line.y.push_back(data[i]);
			}
			if(line.x.empty())
				throw validationError("No bins lie within the requested range");
			line.extent[0]=line.x.front();
			line.extent[1]=line.x.back();
			line.extent[2]=*std::min_element(line.y.begin(),line.y.end());
			line.extent[3]=*std::max_element(line.y.begin(),line.y.end());
			return(line);
		}

		stepLine histogram::asPolygon(boost::optional<double> ymin, boost::optional<double> xlow,
		                              boost::optional<double> xhigh) const{
			stepLine line=asLine(xlow,xhigh);
			double base=(ymin ? *ymin : std::min(0.0,line.extent[2]));

			stepLine polygon;
			polygon.x.reserve(line.x.size()+2);
			polygon.y.reserve(line.y.size()+2);
			polygon.x.push_back(line.x.front());
			polygon.y.push_back(base);
			polygon.x.insert(polygon.x.end(),line.x.begin(),line.x.end());
			polygon.y.insert(polygon.y.end(),line.y.begin(),line.y.end());
			polygon.x.push_back(line.x.back());
			polygon.y.push_back(base);

			polygon.extent=line.extent;
			polygon.extent[2]=std::min(base,line.extent[2]);
			polygon.extent[3]=std::max(base,line.extent[3]);
			return(polygon);
		}

	} //namespace histograms
} //namespace grid_hist
