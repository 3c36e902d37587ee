#include "GridHist/axis.h"

#include <algorithm>
#include <cmath>
#include <ostream>

#include "GridHist/errors.h"

namespace grid_hist{
	namespace histograms{

		snapMode parseSnap(const std::string& name){
			if(name=="nearest")
				return(SNAP_NEAREST);
			if(name=="low")
				return(SNAP_LOW);
			if(name=="high")
				return(SNAP_HIGH);
			if(name=="both")
				return(SNAP_BOTH);
			if(name=="expand")
				return(SNAP_EXPAND);
			if(name=="clip")
				return(SNAP_CLIP);
			throw validationError("Unknown snap keyword: '"+name+"'");
		}

		std::string snapName(snapMode snap){
			switch(snap){
				case SNAP_NEAREST: return("nearest");
				case SNAP_LOW: return("low");
				case SNAP_HIGH: return("high");
				case SNAP_BOTH: return("both");
				case SNAP_EXPAND: return("expand");
				case SNAP_CLIP: return("clip");
			}
			throw validationError("Invalid snap mode: "+std::to_string(static_cast<int>(snap)));
		}

		void axis::checkEdges(const std::vector<externalCoordinate>& e){
			if(e.size()<2)
				throw validationError("Axis edges must contain at least two values (got "+std::to_string(e.size())+")");
			for(size_t i=1; i<e.size(); i++){
				//written so that NaN edges are rejected as well
				if(!(e[i-1]<e[i]))
					throw validationError("Axis edges must be strictly increasing (edge "+std::to_string(i)+
					                      " is "+std::to_string(e[i])+", previous is "+std::to_string(e[i-1])+")");
			}
		}

		axis::axis(int count, const std::vector<externalCoordinate>& limits, std::string label):
		label(std::move(label)){
			if(limits.empty())
				throw typeError("A bin count requires the limits of the axis");
			if(limits.size()!=2)
				throw validationError("Axis limits must be a (low, high) pair (got "+std::to_string(limits.size())+" values)");
			if(!(limits[0]<limits[1]))
				throw validationError("Axis limits must be increasing (got "+std::to_string(limits[0])+
				                      ", "+std::to_string(limits[1])+")");
			if(count<1)
				throw validationError("An axis must have at least one bin (got "+std::to_string(count)+")");
			edges.resize(count+1);
			const externalCoordinate step=(limits[1]-limits[0])/count;
			for(int i=0; i<count; i++)
				edges[i]=limits[0]+i*step;
			edges[count]=limits[1];
		}

		axis::axis(std::vector<externalCoordinate> e, std::string label):
		edges(std::move(e)),label(std::move(label)){
			checkEdges(edges);
		}

		void axis::setEdges(std::vector<externalCoordinate> newEdges){
			checkEdges(newEdges);
			edges=std::move(newEdges);
		}

		axis::externalCoordinate axis::getBinWidth(unsigned int bin) const{
			if(bin>=numBins())
				throw validationError("Bin index "+std::to_string(bin)+" out of range for axis with "
				                      +std::to_string(numBins())+" bins");
			return(edges[bin+1]-edges[bin]);
		}

		std::vector<axis::externalCoordinate> axis::binWidths() const{
			std::vector<externalCoordinate> widths(numBins());
			for(unsigned int i=0; i<numBins(); i++)
				widths[i]=edges[i+1]-edges[i];
			return(widths);
		}

		std::vector<axis::externalCoordinate> axis::binCenters() const{
			std::vector<externalCoordinate> centers(numBins());
			for(unsigned int i=0; i<numBins(); i++)
				centers[i]=getBinCenter(i);
			return(centers);
		}

		bool axis::inAxis(externalCoordinate x) const{
			return(edges.front()<=x && x<edges.back());
		}

		axis::internalCoordinate axis::findBin(externalCoordinate x) const{
			if(std::isnan(x))
				return(numBins());
			auto it=std::upper_bound(edges.begin(),edges.end(),x);
			return(static_cast<internalCoordinate>(it-edges.begin())-1);
		}

		std::pair<unsigned int,unsigned int> axis::edgeIndices(externalCoordinate x) const{
			const internalCoordinate bin=findBin(x);
			const internalCoordinate maxIndex=numBins();
			unsigned int lowIndex=std::max(bin,0);
			unsigned int highIndex=std::min(bin+1,maxIndex);
			return(std::make_pair(lowIndex,highIndex));
		}

		unsigned int axis::edgeIndex(externalCoordinate x, snapMode snap) const{
			std::pair<unsigned int,unsigned int> bounds=edgeIndices(x);
			switch(snap){
				case SNAP_NEAREST:
				{
					externalCoordinate dLow=std::abs(x-edges[bounds.first]);
					externalCoordinate dHigh=std::abs(edges[bounds.second]-x);
					if(dHigh<dLow)
						return(bounds.second);
					return(bounds.first);
				}
				case SNAP_LOW:
					return(bounds.first);
				case SNAP_HIGH:
					return(bounds.second);
				default:
					throw validationError("Snap mode '"+snapName(snap)+"' cannot select a single edge; "
					                      "use 'nearest', 'low', or 'high'");
			}
		}

		bool axis::isUniform(double rtol, double atol) const{
			std::vector<externalCoordinate> widths=binWidths();
			std::vector<externalCoordinate> sorted(widths);
			std::sort(sorted.begin(),sorted.end());
			const size_t n=sorted.size();
			externalCoordinate median=(n%2 ? sorted[n/2] : (sorted[n/2-1]+sorted[n/2])/2);
			for(externalCoordinate w : widths){
				if(std::abs(w-median)>atol+rtol*std::abs(median))
					return(false);
			}
			return(true);
		}

		namespace{
			snapMode cutSnap(snapMode snap, snapMode expandDirection){
				switch(snap){
					case SNAP_NEAREST:
					case SNAP_LOW:
					case SNAP_HIGH:
						return(snap);
					case SNAP_EXPAND:
					case SNAP_CLIP:
						return(expandDirection);
					default:
						throw validationError("Unknown snap mode for cut: '"+snapName(snap)+
						                      "'; use 'nearest', 'expand', 'low', 'high', or 'clip'");
				}
			}
		}

		std::pair<axis,std::vector<bool>> axis::cut(boost::optional<externalCoordinate> low,
		                                            boost::optional<externalCoordinate> high,
		                                            snapMode lowSnap, snapMode highSnap) const{
			snapMode lowEdgeSnap=cutSnap(lowSnap,SNAP_LOW);
			snapMode highEdgeSnap=cutSnap(highSnap,SNAP_HIGH);

			unsigned int lowIndex=0;
			if(low)
				lowIndex=edgeIndex(*low,lowEdgeSnap);
			unsigned int highIndex=numBins();
			if(high){
				highIndex=edgeIndex(*high,highEdgeSnap);
				//an upper bound lying exactly on an interior edge would otherwise be clipped to a zero-width bin
				if(highSnap==SNAP_CLIP && highIndex>0 && edges[highIndex-1]==*high)
					highIndex--;
			}

			std::vector<bool> mask(numBins(),false);
			if(highIndex<=lowIndex)
				throw validationError("Cut to ["+(low?std::to_string(*low):std::string("min"))+", "
				                      +(high?std::to_string(*high):std::string("max"))+"] leaves no bins");
			std::vector<externalCoordinate> newEdges(edges.begin()+lowIndex,edges.begin()+highIndex+1);
			for(unsigned int i=lowIndex; i<highIndex; i++)
				mask[i]=true;

			if(low && lowSnap==SNAP_CLIP)
				newEdges.front()=*low;
			if(high && highSnap==SNAP_CLIP)
				newEdges.back()=*high;

			return(std::make_pair(axis(std::move(newEdges),label),std::move(mask)));
		}

		std::vector<unsigned int> axis::mergedEdgeIndices(unsigned int n, snapMode snap, bool clip) const{
			if(snap!=SNAP_LOW && snap!=SNAP_HIGH)
				throw validationError("Unknown snap mode for merging bins: '"+snapName(snap)+"'; use 'low' or 'high'");
			if(n<1)
				throw validationError("Bins must be merged in groups of at least one");
			const unsigned int nb=numBins();
			const unsigned int remainder=nb%n;

			std::vector<unsigned int> indices;
			if(remainder!=0 && !clip && snap==SNAP_HIGH)
				indices.push_back(0);
			unsigned int start=(remainder!=0 && snap==SNAP_HIGH ? remainder : 0);
			for(unsigned int i=start; i<=nb; i+=n)
				indices.push_back(i);
			if(remainder!=0 && !clip && snap==SNAP_LOW)
				indices.push_back(nb);
			return(indices);
		}

		axis axis::mergeBins(unsigned int n, snapMode snap, bool clip) const{
			std::vector<unsigned int> indices=mergedEdgeIndices(n,snap,clip);
			std::vector<externalCoordinate> newEdges;
			newEdges.reserve(indices.size());
			for(unsigned int i : indices)
				newEdges.push_back(edges[i]);
			return(axis(std::move(newEdges),label));
		}

		bool axis::operator==(const axis& other) const{
			if(edges.size()!=other.edges.size())
				return(false);
			for(size_t i=0; i<edges.size(); i++){
				if(std::abs(edges[i]-other.edges[i])>1e-8+1e-5*std::abs(other.edges[i]))
					return(false);
			}
			return(true);
		}

		std::ostream& operator<<(std::ostream& os, const axis& a){
			os << "axis(";
			if(!a.getLabel().empty())
				os << '"' << a.getLabel() << "\", ";
			os << a.numBins() << " bins: [";
			const std::vector<double>& edges=a.getEdges();
			for(size_t i=0; i<edges.size(); i++){
				if(i)
					os << ", ";
				os << edges[i];
			}
			os << "])";
			return(os);
		}

		namespace{
			class axisBuilder : public boost::static_visitor<axis>{
			public:
				axis operator()(const edgeList& spec) const{
					return(axis(spec.edges,spec.label));
				}
				axis operator()(const uniformBinning& spec) const{
					return(axis(spec.count,spec.limits,spec.label));
				}
				axis operator()(const axis& a) const{
					return(a.clone());
				}
			};
		}

		axis makeAxis(const axisSpec& spec){
			return(boost::apply_visitor(axisBuilder(),spec));
		}

	} //namespace histograms
} //namespace grid_hist
