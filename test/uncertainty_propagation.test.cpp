#include <cmath>

#include <GridHist/histogram.h>
#include "test_checks.h"

using namespace grid_hist;
using namespace grid_hist::histograms;

int main(){
	const std::vector<axis> axes{axis(3,{0,3})};
	const histogram h1(axes,{1,2,3},INTEGER,std::vector<double>{1,2,3});
	
	//scaling by exact numbers scales the uncertainty
	histogram h2=h1*2;
	check(h2.hasUncertainty(),"scaling keeps uncertainty tracking");
	check(allClose(h2.getUncertainty(),{2,4,6}),"uncertainty of doubled histogram: "+show(h2.getUncertainty()));
	histogram half=h1/2;
	check(allClose(half.getData(),{0.5,1,1.5}),"halved contents");
	check(allClose(half.getUncertainty(),{0.5,1,1.5}),"uncertainty of halved histogram: "+show(half.getUncertainty()));
	histogram shifted=h1+10;
	check(allClose(shifted.getUncertainty(),{1,2,3}),"adding an exact number leaves uncertainty alone");
	
	//products and quotients combine relative uncertainties
	histogram h3=h1*h2;
	std::vector<double> expected(3);
	for(unsigned int i=0; i<3; i++){
		double r1=h1.getUncertainty()[i]/h1.getData()[i];
		double r2=h2.getUncertainty()[i]/h2.getData()[i];
		expected[i]=std::sqrt(r1*r1+r2*r2)*h3.getData()[i];
	}
	check(allClose(h3.getUncertainty(),expected),"uncertainty of product: "+show(h3.getUncertainty()));
	histogram q=h1/h2;
	for(unsigned int i=0; i<3; i++)
		expected[i]=std::sqrt(2.)*q.getData()[i];
	check(allClose(q.getUncertainty(),expected),"uncertainty of quotient: "+show(q.getUncertainty()));
	
	//sums and differences add in quadrature
	histogram s=h1+h2;
	check(allClose(s.getUncertainty(),{std::sqrt(5.),std::sqrt(20.),std::sqrt(45.)}),"uncertainty of sum: "+show(s.getUncertainty()));
	histogram d=h2-h1;
	check(allClose(d.getUncertainty(),s.getUncertainty()),"uncertainty of difference");
	
	//histograms without tracked uncertainties contribute poisson estimates when combined with one that has them
	const histogram counts(axes,{4,9,16},INTEGER);
	histogram mixed=h1+counts;
	check(mixed.hasUncertainty(),"tracking spreads to the result");
	check(allClose(mixed.getUncertainty(),{std::sqrt(1+4.),std::sqrt(4+9.),std::sqrt(9+16.)}),
	      "poisson estimate of untracked operand: "+show(mixed.getUncertainty()));
	
	//without any tracked uncertainty the result does not track either
	histogram plain=counts+counts;
	check(!plain.hasUncertainty(),"untracked operands give an untracked result");
	check(allClose(plain.getUncertainty(),{std::sqrt(8.),std::sqrt(18.),std::sqrt(32.)}),"poisson estimate of untracked result");
	
	//zero contents contribute no relative uncertainty
	const histogram zeros(axes,{0,2,0},INTEGER,std::vector<double>{1,1,0});
	histogram p=h1*zeros;
	check(allClose(p.getData(),{0,4,0}),"product with zeros");
	check(allClose(p.getUncertainty(),{0,4*std::sqrt(1+0.25),0}),"uncertainty of product with zeros: "+show(p.getUncertainty()));
	histogram z=h1/zeros;
	check(allClose(z.getData(),{0,1,0}),"quotient with zero denominators");
	check(allClose(z.getUncertainty(),{0,std::sqrt(1+0.25),0}),"uncertainty of quotient with zero denominators: "+show(z.getUncertainty()));
	for(double u : z.getUncertainty())
		check(std::isfinite(u),"uncertainties stay finite");
	
	//in-place operations update the tracked uncertainty
	histogram acc=h1.clone(REAL);
	acc*=3;
	check(allClose(acc.getUncertainty(),{3,6,9}),"in-place scaling");
	acc-=h1;
	check(allClose(acc.getUncertainty(),{std::sqrt(10.),std::sqrt(40.),std::sqrt(90.)}),"in-place subtraction");
	
	//bulk setting
	histogram b=h1.clone();
	b.set(4,0.5);
	check(b.getData()==std::vector<double>(3,4) && b.getUncertainty()==std::vector<double>(3,0.5),"set contents and uncertainty");
	b.reset();
	check(b.getData()==std::vector<double>(3,0) && !b.hasUncertainty(),"reset clears contents and uncertainty");
	checkThrows<typeError>([&]{ b.set(0.5); },"set a fraction in an integer histogram");
	
	return(finish());
}
