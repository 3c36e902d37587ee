#include "GridHist/histogram.h"

#include <cmath>
#include <utility>

namespace grid_hist{
	namespace histograms{

		namespace{
			///An operand reduced to per-bin values, so that scalars, arrays, and histograms
			///can all be handled by the same loop
			struct resolvedOperand{
				std::vector<double> values;
				bool scalar;
				dataType type;
				///whether this operand is a histogram which tracks uncertainties
				bool tracksUncertainty;
				///per-bin uncertainties; empty for scalars and arrays, which are treated as exact
				std::vector<double> uncertainty;

				double value(size_t i) const{ return(scalar?values.front():values[i]); }
				double error(size_t i) const{ return(uncertainty.empty()?0:uncertainty[i]); }
			};

			class operandResolver : public boost::static_visitor<resolvedOperand>{
				const histogram& target;
			public:
				explicit operandResolver(const histogram& target):target(target){}

				resolvedOperand operator()(const scalarOperand& s) const{
					return(resolvedOperand{std::vector<double>{s.value},true,s.type,false,std::vector<double>()});
				}
				resolvedOperand operator()(const arrayOperand& a) const{
					if(a.values.size()!=target.size())
						throw validationError("Array of size "+std::to_string(a.values.size())+
						                      " cannot be combined with a histogram of size "+std::to_string(target.size()));
					return(resolvedOperand{a.values,false,a.type,false,std::vector<double>()});
				}
				resolvedOperand operator()(const histogram* h) const{
					if(!h)
						throw validationError("Null histogram operand");
					if(h->getDimensions()!=target.getDimensions())
						throw validationError("Cannot combine histograms with "+std::to_string(target.getDimensions())+
						                      " and "+std::to_string(h->getDimensions())+" dimensions");
					for(unsigned int d=0; d<target.getDimensions(); d++){
						if(h->getAxis(d)!=target.getAxis(d))
							throw validationError("Cannot combine histograms whose axes differ in dimension "+std::to_string(d));
					}
					return(resolvedOperand{h->getData(),false,h->getDataType(),h->hasUncertainty(),h->getUncertainty()});
				}
			};

			double combine(binaryOperation op, double a, double b){
				switch(op){
					case ADD: return(a+b);
					case SUBTRACT: return(a-b);
					case MULTIPLY: return(a*b);
					case DIVIDE: return(b==0 ? 0 : a/b);
				}
				return(0);
			}

			double relative(double error, double value){
				return(value==0 ? 0 : error/value);
			}

			double combineUncertainty(binaryOperation op, double result, double a, double ua, double b, double ub){
				if(op==ADD || op==SUBTRACT)
					return(std::sqrt(ua*ua+ub*ub));
				double ra=relative(ua,a);
				double rb=relative(ub,b);
				double u=std::abs(result)*std::sqrt(ra*ra+rb*rb);
				if(!std::isfinite(u))
					return(0);
				return(u);
			}

			dataType resultType(binaryOperation op, dataType t1, dataType t2){
				if(op==DIVIDE || t1==REAL || t2==REAL)
					return(REAL);
				return(INTEGER);
			}

			///The contents and uncertainties produced by an operation
			struct operationResult{
				std::vector<double> data;
				dataType type;
				boost::optional<std::vector<double>> uncert;
			};

			operationResult compute(binaryOperation op, const histogram& h, const resolvedOperand& other, bool reflected){
				const std::vector<double>& d=h.getData();
				const size_t n=d.size();
				operationResult result;
				result.type=resultType(op,h.getDataType(),other.type);
				result.data.resize(n);

				const bool propagate=h.hasUncertainty() || other.tracksUncertainty;
				std::vector<double> hUncert;
				if(propagate){
					hUncert=h.getUncertainty();
					result.uncert=std::vector<double>(n);
				}

				for(size_t i=0; i<n; i++){
					double a=d[i], b=other.value(i);
					if(reflected)
						std::swap(a,b);
					double r=combine(op,a,b);
					if(result.type==INTEGER)
						r=std::trunc(r);
					result.data[i]=r;
					if(propagate){
						double ua=hUncert[i], ub=other.error(i);
						if(reflected)
							std::swap(ua,ub);
						(*result.uncert)[i]=combineUncertainty(op,r,a,ua,b,ub);
					}
				}
				return(result);
			}
		}

		histogram applyBinaryOperation(binaryOperation op, const histogram& h, const operand& other, bool reflected){
			resolvedOperand resolved=boost::apply_visitor(operandResolver(h),other);
			operationResult result=compute(op,h,resolved,reflected);
			return(histogram(h.getAxes(),std::move(result.data),result.type,std::move(result.uncert),
			                 h.getLabel(),h.getTitle()));
		}

		void applyBinaryOperationInPlace(binaryOperation op, histogram& h, const operand& other){
			resolvedOperand resolved=boost::apply_visitor(operandResolver(h),other);
			if(h.getDataType()==INTEGER && resultType(op,INTEGER,resolved.type)==REAL){
				const bool histogramOperand=(boost::get<const histogram*>(&other)!=nullptr);
				if(op!=DIVIDE || histogramOperand)
					throw typeError("In-place "+std::string(op==DIVIDE?"division":"operation")+
					                " would store real values in an integer histogram; clone it as REAL first");
			}
			operationResult result=compute(op,h,resolved,false);
			h.setData(std::move(result.data),result.type);
			if(result.uncert)
				h.setUncertainty(std::move(*result.uncert));
			else
				h.clearUncertainty();
		}

	} //namespace histograms
} //namespace grid_hist
