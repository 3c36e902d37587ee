#include <GridHist/histogram.h>
#include "test_checks.h"

using namespace grid_hist;
using namespace grid_hist::histograms;

int main(){
	const std::vector<axis> axes{axis(2,{0,2},"row"),axis(3,{0,3},"column")};
	histogram h(axes,{0,1,2,3,4,5},INTEGER,std::vector<double>{1,1,1,2,2,2},"slices");
	
	histogram row=h.extractSlice(0,1);
	check(row.getDimensions()==1,"slice loses the sliced dimension");
	check(row.getAxis(0)==h.getAxis(1) && row.getAxis(0).getLabel()=="column","slice keeps the other axis");
	check(row.getData()==std::vector<double>({3,4,5}),"contents of a row: "+show(row.getData()));
	check(row.getUncertainty()==std::vector<double>({2,2,2}),"uncertainties of a row");
	check(row.getLabel()=="slices" && row.getDataType()==INTEGER,"slice keeps metadata");
	
	histogram column=h.extractSlice(1,2);
	check(column.getAxis(0)==h.getAxis(0),"column slice keeps the first axis");
	check(column.getData()==std::vector<double>({2,5}),"contents of a column: "+show(column.getData()));
	
	std::vector<histogram> columns=h.slices(1);
	check(columns.size()==3,"one slice per bin");
	for(unsigned int i=0; i<columns.size(); i++)
		check(columns[i].getData()==std::vector<double>({double(i),double(i+3)}),"column "+std::to_string(i));
	
	//three dimensions down to two
	histogram cube(axis(2,{0,2}),axis(2,{0,2}),axis(2,{0,2}));
	cube.setData({0,1,2,3,4,5,6,7});
	histogram face=cube.extractSlice(1,0);
	check(face.shape()==std::vector<unsigned int>({2,2}),"slice of a cube is a square");
	check(face.getData()==std::vector<double>({0,1,4,5}),"contents of a face: "+show(face.getData()));
	
	checkThrows<validationError>([&]{ row.extractSlice(0,0); },"slicing a one dimensional histogram");
	checkThrows<validationError>([&]{ h.extractSlice(0,2); },"slicing beyond the last bin");
	checkThrows<validationError>([&]{ h.extractSlice(2,0); },"slicing a nonexistent dimension");
	
	return(finish());
}
