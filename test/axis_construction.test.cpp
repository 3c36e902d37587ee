#include <GridHist/axis.h>
#include <GridHist/errors.h>
#include "test_checks.h"

using namespace grid_hist;
using namespace grid_hist::histograms;

int main(){
	//uniform construction for several bin counts and ranges
	const int counts[]={1,3,10,17};
	const double ranges[][2]={{0,1},{-5,5},{2.5,3.75}};
	for(int n : counts){
		for(const auto& range : ranges){
			axis a(n,{range[0],range[1]});
			const std::string name=std::to_string(n)+" bins over ["+std::to_string(range[0])+", "+std::to_string(range[1])+"]";
			check(a.numBins()==(unsigned int)n,"bin count of "+name);
			check(a.getEdges().front()==range[0],"first edge of "+name);
			check(a.getEdges().back()==range[1],"last edge of "+name);
			for(double w : a.binWidths())
				check(approxEqual(w,(range[1]-range[0])/n),"uniform width of "+name);
			check(a.isUniform(),name+" should be uniform");
		}
	}
	
	axis x(std::vector<double>{0,1,3,6},"x");
	check(x.numBins()==3,"explicit edges bin count");
	check(x.getLabel()=="x","axis label");
	check(x.min()==0 && x.max()==6,"axis extremes");
	check(x.limits()==std::make_pair(0.0,6.0),"axis limits");
	check(x.overflow()==7,"overflow lies above the range");
	check(allClose(x.binWidths(),{1,2,3}),"explicit bin widths: "+show(x.binWidths()));
	check(allClose(x.binCenters(),{0.5,2,4.5}),"explicit bin centers: "+show(x.binCenters()));
	check(x.getBinWidth()==2,"default bin width is that of the second bin");
	check(x.getBinWidth(2)==3,"bin width of last bin");
	check(x.getBinEdge(1)==1 && x.getBinEdge(3)==6,"lower edges of bins, and the upper edge");
	check(x.getBinCenter(2)==4.5,"center of last bin");
	check(!x.isUniform(),"explicit edges are not uniform");
	checkThrows<validationError>([&]{ x.getBinWidth(3); },"width of a nonexistent bin");
	
	//failure modes
	checkThrows<validationError>([]{ axis(std::vector<double>{0,2,1}); },"non-increasing edges");
	checkThrows<validationError>([]{ axis(std::vector<double>{1,1}); },"repeated edges");
	checkThrows<validationError>([]{ axis(std::vector<double>{1}); },"single edge");
	checkThrows<validationError>([]{ axis(5,{1,0}); },"decreasing limits");
	checkThrows<validationError>([]{ axis(5,{0,1,2}); },"three limits");
	checkThrows<typeError>([]{ axis(5,std::vector<double>()); },"bin count without limits");
	checkThrows<validationError>([]{ axis(0,{0,1}); },"zero bins");
	
	//edges may be replaced, but are validated
	axis y(4,{0,4});
	y.setEdges({0,0.5,4});
	check(y.numBins()==2,"replaced edges");
	checkThrows<validationError>([&]{ y.setEdges({0,3,2}); },"replacing with non-increasing edges");
	check(y.numBins()==2 && y.getEdges()[1]==0.5,"failed replacement leaves edges unchanged");
	
	//equality ignores labels and tiny differences
	axis a1(std::vector<double>{0,1,2},"first");
	axis a2(std::vector<double>{0,1+1e-12,2},"second");
	axis a3(std::vector<double>{0,1.5,2});
	axis a4(std::vector<double>{0,1,2,3});
	check(a1==a2,"axes differing only by label and rounding are equal");
	check(a1!=a3,"axes with different edges are not equal");
	check(a1!=a4,"axes with different bin counts are not equal");
	
	axis copy=a1.clone();
	copy.setLabel("changed");
	check(a1.getLabel()=="first","clones are independent");
	
	//construction from specifications
	axis fromEdges=makeAxis(edgeList{{0,2,5},"e"});
	check(fromEdges.numBins()==2 && fromEdges.getLabel()=="e","axis from edge list");
	axis fromBinning=makeAxis(uniformBinning{5,{0,10},"u"});
	check(fromBinning==axis(std::vector<double>{0,2,4,6,8,10}),"axis from uniform binning");
	check(fromBinning.getLabel()=="u","label from uniform binning");
	axis fromAxis=makeAxis(a1);
	check(fromAxis==a1 && fromAxis.getLabel()=="first","axis from axis");
	checkThrows<typeError>([]{ makeAxis(uniformBinning{5,{},""}); },"uniform binning without limits");
	
	//snap keywords
	check(parseSnap("nearest")==SNAP_NEAREST,"parse nearest");
	check(parseSnap("clip")==SNAP_CLIP,"parse clip");
	check(snapName(SNAP_EXPAND)=="expand","name of expand");
	checkThrows<validationError>([]{ parseSnap("middle"); },"unknown snap keyword");
	
	return(finish());
}
