#include <GridHist/histogram.h>
#include "test_checks.h"

using namespace grid_hist;
using namespace grid_hist::histograms;

int main(){
	const std::vector<axis> axes{axis(3,{0,3},"x")};
	const histogram h1(axes,{1,2,3},INTEGER,boost::none,"h1");
	const histogram h2(axes,{2,1,0},INTEGER);
	const histogram h3(axes,{5,7,11},INTEGER);
	
	//scalar, array and histogram operands
	histogram sum=h1+1;
	check(sum.getData()==std::vector<double>({2,3,4}),"histogram plus scalar: "+show(sum.getData()));
	check(sum.getDataType()==INTEGER,"integer plus integer is integer");
	check(sum.getLabel()=="h1","results keep the label of the histogram");
	check(sum.getAxis(0)==h1.getAxis(0) && sum.getAxis(0).getLabel()=="x","results keep the axes");
	sum=h1+std::vector<int>{2,3,4};
	check(sum.getData()==std::vector<double>({3,5,7}),"histogram plus array: "+show(sum.getData()));
	sum=h1+h2;
	check(sum.getData()==std::vector<double>({3,3,3}),"histogram plus histogram: "+show(sum.getData()));
	check(h1.getData()==std::vector<double>({1,2,3}),"operands are not modified");
	check((1+h1).getData()==(h1+1).getData(),"scalar addition commutes");
	check((std::vector<int>{2,3,4}+h1).getData()==(h1+std::vector<int>{2,3,4}).getData(),"array addition commutes");
	
	//algebraic properties
	check((h1+h2).getData()==(h2+h1).getData(),"histogram addition commutes");
	check((h1*h3).getData()==(h3*h1).getData(),"histogram multiplication commutes");
	check(((h1+h2)+h3).getData()==(h1+(h2+h3)).getData(),"histogram addition associates");
	check(((h1*h2)*h3).getData()==(h1*(h2*h3)).getData(),"histogram multiplication associates");
	check(((h1+h2)-h2).getData()==h1.getData(),"subtraction undoes addition");
	check((10-h1).getData()==std::vector<double>({9,8,7}),"reflected subtraction: "+show((10-h1).getData()));
	check((h1-h2).getData()==std::vector<double>({-1,1,3}),"histogram subtraction");
	
	//types
	histogram scaled=h1*2.;
	check(scaled.getDataType()==REAL && scaled.getData()==std::vector<double>({2,4,6}),"real scalar gives real result");
	check((2.*h1).getDataType()==REAL,"reflected real scalar gives real result");
	check((h1*2).getDataType()==INTEGER,"integer scalar keeps integer result");
	check((h1+std::vector<double>{0.5,0.5,0.5}).getDataType()==REAL,"real array gives real result");
	
	//division always produces real contents, and zero where dividing by zero
	histogram quotient=h1/h2;
	check(quotient.getDataType()==REAL,"division gives real result");
	check(allClose(quotient.getData(),{0.5,2,0}),"histogram division: "+show(quotient.getData()));
	check(allClose((h1/2).getData(),{0.5,1,1.5}),"division by scalar");
	check(allClose((6/h1).getData(),{6,3,2}),"reflected division by scalar");
	check(allClose((std::vector<double>{2,4,6}/h1).getData(),{2,2,2}),"reflected division of array");
	check(allClose((h1/0).getData(),{0,0,0}),"division by zero scalar");
	
	//mismatches
	const histogram other(std::vector<axis>{axis(3,{0,4})},{1,1,1},INTEGER);
	const histogram twoD(std::vector<axis>{axis(3,{0,3}),axis(1,{0,1})},{1,1,1},INTEGER);
	checkThrows<validationError>([&]{ h1+other; },"histograms with different axes");
	checkThrows<validationError>([&]{ h1*twoD; },"histograms with different dimensions");
	checkThrows<validationError>([&]{ h1+std::vector<int>{1,2}; },"array of the wrong size");
	
	//in-place forms keep the receiver's axes
	histogram acc=h1.clone();
	acc+=h2;
	check(acc.getData()==std::vector<double>({3,3,3}) && acc.getDataType()==INTEGER,"in-place addition");
	acc-=1;
	acc*=h3;
	check(acc.getData()==std::vector<double>({10,14,22}),"in-place subtraction and multiplication: "+show(acc.getData()));
	acc*=std::vector<int>{1,0,1};
	check(acc.getData()==std::vector<double>({10,0,22}),"in-place multiplication by array");
	
	//in-place division
	histogram counts=h1.clone();
	checkThrows<typeError>([&]{ counts/=h2; },"in-place division of integers by a histogram");
	check(counts.getData()==std::vector<double>({1,2,3}) && counts.getDataType()==INTEGER,
	      "failed in-place division leaves the histogram untouched");
	checkThrows<typeError>([&]{ counts+=1.5; },"in-place addition of a real to integers");
	checkThrows<typeError>([&]{ counts*=scaled; },"in-place multiplication of integers by a real histogram");
	counts/=2;
	check(counts.getDataType()==REAL && allClose(counts.getData(),{0.5,1,1.5}),"in-place division by a scalar promotes");
	histogram promoted=h1.clone();
	promoted/=std::vector<int>{1,4,3};
	check(promoted.getDataType()==REAL && allClose(promoted.getData(),{1,0.5,1}),"in-place division by an array promotes");
	histogram real=h1.clone(REAL);
	real/=h2;
	check(allClose(real.getData(),{0.5,2,0}),"in-place division of reals by a histogram");
	real+=0.25;
	check(allClose(real.getData(),{0.75,2.25,0.25}),"in-place addition of a real");
	
	//integer products beyond the exactly representable range
	histogram big(std::vector<axis>{axis(1,{0,1})},{1e10},INTEGER);
	checkThrows<typeError>([&]{ big*big; },"integer product out of range");
	checkThrows<typeError>([&]{ big*=10000000000LL; },"in-place integer product out of range");
	check(big.getData()==std::vector<double>({1e10}),"failed in-place product leaves contents alone");
	histogram bigReal=big.clone(REAL)*big;
	check(bigReal.getDataType()==REAL && bigReal.getData()==std::vector<double>({1e20}),"real product out of integer range");
	
	//point evaluation
	histogram shifted(std::vector<axis>{axis(10,{0,10})},{10,11,12,13,14,15,16,17,18,19},INTEGER);
	check(shifted(5)==15,"evaluation at a bin edge");
	check(shifted(5.5)==15,"evaluation inside a bin");
	check(shifted.evaluate({0})==10,"evaluation at the lower limit");
	checkThrows<validationError>([&]{ shifted(10); },"evaluation at the upper limit");
	checkThrows<validationError>([&]{ shifted(-1); },"evaluation below the histogram");
	
	return(finish());
}
