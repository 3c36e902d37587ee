#ifndef GRIDHIST_DETAIL_GRID_INDEX_H
#define GRIDHIST_DETAIL_GRID_INDEX_H

#include <cstddef>
#include <vector>

namespace grid_hist{
	namespace histograms{
	namespace detail{
		
		///Computes the element strides of a dense row-major (last index fastest) array
		inline std::vector<size_t> rowMajorStrides(const std::vector<unsigned int>& shape){
			std::vector<size_t> strides(shape.size());
			size_t stride=1;
			for(size_t i=shape.size(); i>0; i--){
				strides[i-1]=stride;
				stride*=shape[i-1];
			}
			return(strides);
		}
		
		///Number of elements in a dense array of the given shape
		inline size_t elementCount(const std::vector<unsigned int>& shape){
			size_t count=1;
			for(unsigned int extent : shape)
				count*=extent;
			return(count);
		}
		
		///\brief Steps a multi-dimensional index to the next cell in row-major order.
		///\return false once the index has wrapped around past the last cell
		inline bool advanceIndex(std::vector<unsigned int>& index, const std::vector<unsigned int>& shape){
			for(size_t i=index.size(); i>0; i--){
				if(++index[i-1]<shape[i-1])
					return(true);
				index[i-1]=0;
			}
			return(false);
		}
		
		inline size_t flatten(const std::vector<unsigned int>& index, const std::vector<size_t>& strides){
			size_t offset=0;
			for(size_t i=0; i<index.size(); i++)
				offset+=index[i]*strides[i];
			return(offset);
		}
		
	} //namespace detail
	} //namespace histograms
} //namespace grid_hist

#endif //GRIDHIST_DETAIL_GRID_INDEX_H
