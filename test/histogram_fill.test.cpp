#include <cmath>

#include <GridHist/histogram.h>
#include "test_checks.h"

using namespace grid_hist;
using namespace grid_hist::histograms;

int main(){
	histogram h(axis(10,{0,10}));
	std::vector<double> samples{3,3,3};
	h.fill(samples);
	check(h.binContent({3})==3,"repeated samples accumulate");
	check(h.getDataType()==INTEGER,"counting keeps integer contents");
	check(!h.hasUncertainty(),"counting does not start tracking uncertainties");
	check(approxEqual(h.getUncertainty()[3],std::sqrt(3.)),"poisson uncertainty of counts");
	
	//samples outside the axis are dropped without complaint
	std::vector<double> outside{-1,10,12,9.99};
	h.fill(outside);
	check(h.sum().value==4,"only the sample inside the axis is counted");
	check(h.binContent({9})==1,"sample in the last bin");
	
	histogram h2(axis(2,{0,2}),axis(3,{0,3}));
	std::vector<std::vector<double>> coordinates{{0.5,1.5,1.5,5},{2.5,0.5,0.5,1}};
	h2.fill(coordinates);
	check(h2.binContent({0,2})==1,"two dimensional fill, first cell");
	check(h2.binContent({1,0})==2,"two dimensional fill, second cell");
	check(h2.sum().value==3,"two dimensional fill drops samples outside any axis");
	
	h2.fillOne({0.5,2.5},3);
	check(h2.binContent({0,2})==4,"single sample with weight");
	h2.fillOne({2.5,2.5});
	check(h2.sum().value==6,"single sample outside the histogram is dropped");
	
	//weights
	std::vector<double> weights{1,2,3,4};
	h2.fill(coordinates,weights);
	check(h2.binContent({1,0})==7,"per-sample weights");
	std::vector<double> fractional{0.5,0.5,0.5,0.5};
	checkThrows<typeError>([&]{ h2.fill(coordinates,fractional); },"fractional weights in an integer histogram");
	checkThrows<typeError>([&]{ h2.fill(coordinates,0.5); },"fractional weight in an integer histogram");
	histogram r=h2.clone(REAL);
	r.fill(coordinates,fractional);
	check(approxEqual(r.binContent({1,0}),8),"fractional weights in a real histogram");
	
	//malformed samples
	std::vector<std::vector<double>> tooMany{{1},{1},{1}};
	checkThrows<validationError>([&]{ h2.fill(tooMany); },"too many coordinate arrays");
	std::vector<std::vector<double>> ragged{{1,2},{1}};
	checkThrows<validationError>([&]{ h2.fill(ragged); },"coordinate arrays of different lengths");
	std::vector<double> shortWeights{1};
	checkThrows<validationError>([&]{ h2.fill(coordinates,shortWeights); },"too few weights");
	checkThrows<validationError>([&]{ h2.fillOne({1}); },"point with too few coordinates");
	
	//weights which carry uncertainties begin uncertainty tracking, starting from the poisson estimate
	histogram u(axis(3,{0,3}));
	u.fill(std::vector<double>{1.5,1.5,1.5,1.5});
	std::vector<std::vector<double>> points{{0.5,0.5,2.5,1.5}};
	std::vector<double> w{1,2,1,1};
	std::vector<double> wErr{0.5,0.5,1,3};
	u.fill(points,w,wErr);
	check(u.hasUncertainty(),"uncertain weights start tracking");
	check(u.getData()==std::vector<double>({3,5,1}),"contents after uncertain fill: "+show(u.getData()));
	check(allClose(u.getUncertainty(),{std::sqrt(0.5),std::sqrt(4+9.),1}),
	      "uncertainties after uncertain fill: "+show(u.getUncertainty()));
	
	//once tracked, plain weights add in quadrature
	u.fillOne({0.5},2);
	check(approxEqual(u.getUncertainty()[0],std::sqrt(4.5)),"tracked uncertainty with a plain weight");
	u.fillOne({2.5},1,2);
	check(approxEqual(u.getUncertainty()[2],std::sqrt(5.)),"single sample with weight uncertainty");
	std::vector<double> shortErr{1};
	checkThrows<validationError>([&]{ u.fill(points,w,shortErr); },"too few weight uncertainties");
	
	//samples given point by point
	histogram s(axis(2,{0,2}),axis(2,{0,2}));
	s.fillFromSample({{0.5,0.5},{1.5,0.5},{1.5,0.5},{0.5,1.5},{5,5}});
	check(s.getData()==std::vector<double>({1,1,2,0}),"contents filled from a sample: "+show(s.getData()));
	s.fillFromSample({{0.5,0.5},{1.5,1.5}},std::vector<double>{2,3});
	check(s.getData()==std::vector<double>({3,1,2,3}),"contents filled from a weighted sample: "+show(s.getData()));
	checkThrows<validationError>([&]{ s.fillFromSample({{0.5}}); },"sample point with too few coordinates");
	checkThrows<validationError>([&]{ s.fillFromSample({{0.5,0.5}},std::vector<double>{1,2}); },"too many sample weights");
	
	return(finish());
}
