///\file hdf5_serialization.h
///This file contains support code for storing arrays and attributes in HDF5 files

#ifndef GRIDHIST_HDF5_SERIALIZATION_H
#define GRIDHIST_HDF5_SERIALIZATION_H

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "hdf5.h"

namespace grid_hist{
	namespace hdf_interface{

		///\brief A handle for an HDF5 datatype
		class HDFDatatype{
		public:
			const hid_t datatype;

			~HDFDatatype();
			//copies are not okay
			HDFDatatype(const HDFDatatype&)=delete;
			//moves are okay
			HDFDatatype(HDFDatatype&& other):
			datatype(other.datatype),
			disposable(other.disposable){
				other.disposable=false;
			}
			HDFDatatype& operator=(const HDFDatatype&)=delete;
			HDFDatatype& operator=(HDFDatatype&&)=delete;
		private:
			HDFDatatype(hid_t t, bool d):datatype(t),disposable(d){}
			bool disposable;
			template<typename T>
			friend void registerHDFDatatype(hid_t,bool);
		};

		///Tracks all HDF datatypes which are in use
		extern std::unordered_map<std::type_index,HDFDatatype> DatatypeRegistry;

		///Registers an HDF datatype corresponding to a C++ type
		///\param d whether the datatype was allocated by the caller and should be closed when no longer needed
		template<typename T>
		void registerHDFDatatype(hid_t t, bool d){
			HDFDatatype hd(t,d);
			DatatypeRegistry.emplace(typeid(T),std::move(hd));
		}

		///Fetches the HDF datatype for the given C++ datatype
		///\throws std::runtime_error if no datatype has been registered for T
		template<typename T>
		const HDFDatatype& getHDFDatatype(){
			auto it=DatatypeRegistry.find(typeid(T));
			if(it==DatatypeRegistry.end())
				throw std::runtime_error(std::string("No HDF5 datatype registered for ")+typeid(T).name());
			return(it->second);
		}

		///Attaches a scalar attribute to an HDF5 object
		template<typename T>
		void addAttribute(hid_t object, std::string name, const T& contents){
			hid_t dtype=getHDFDatatype<T>().datatype;
			hsize_t dim=1;
			hid_t dataspace_id=H5Screate_simple(1, &dim, NULL);
			hid_t attribute_id=H5Acreate(object,name.c_str(),dtype,dataspace_id,H5P_DEFAULT,H5P_DEFAULT);
			if(attribute_id<0){
				H5Sclose(dataspace_id);
				throw std::runtime_error("Failed to create attribute '"+name+"'");
			}
			H5Awrite(attribute_id, dtype, &contents);
			H5Aclose(attribute_id);
			H5Sclose(dataspace_id);
		}

		template<>
		void addAttribute<std::string>(hid_t object, std::string name, const std::string& contents);

		///Reads a scalar attribute from an HDF5 object
		///\throws std::runtime_error if the attribute's stored type does not match T
		template<typename T>
		void readAttribute(hid_t object, std::string name, T& dest){
			hid_t attribute_id=H5Aopen(object, name.c_str(), H5P_DEFAULT);
			if(attribute_id<0)
				throw std::runtime_error("Failed to open attribute '"+name+"'");
			hid_t actualType=H5Aget_type(attribute_id);
			hid_t expectedType=getHDFDatatype<T>().datatype;

			if(H5Tequal(actualType, expectedType)<=0){
				H5Aclose(attribute_id);
				H5Tclose(actualType);
				throw std::runtime_error("Expected and actual data types for attribute '"+name+"' do not match");
			}
			if(H5Aread(attribute_id, expectedType, &dest)<0){
				H5Aclose(attribute_id);
				H5Tclose(actualType);
				throw std::runtime_error("Failed to read attribute '"+name+"'");
			}
			H5Aclose(attribute_id);
			H5Tclose(actualType);
		}

		template<>
		void readAttribute<std::string>(hid_t object, std::string name, std::string& dest);

		///Whether an object has an attribute with the given name
		bool hasAttribute(hid_t object, const std::string& name);

		///Lists the names of the members of a group
		std::set<std::string> groupContents(hid_t group_id);

		///\brief Writes a dense row-major array as a dataset.
		///\param container the group in which to create the dataset
		///\param name the name of the dataset
		///\param values the array contents, converted to T on write
		///\param extents the size of the array in each dimension
		///\param compressLevel the gzip compression level to apply, or zero for none
		///\return the open dataset, which the caller must close
		template<typename T>
		hid_t writeArray(hid_t container, const std::string& name, const std::vector<T>& values,
		                 const std::vector<hsize_t>& extents, unsigned int compressLevel=0){
			const hid_t dType=getHDFDatatype<T>().datatype;
			const int dim=extents.size();
			hid_t plist_id=H5P_DEFAULT;
			if(compressLevel){
				if(compressLevel>9)
					throw std::runtime_error("Invalid compression level "+std::to_string(compressLevel));
				plist_id=H5Pcreate(H5P_DATASET_CREATE);
				std::vector<hsize_t> chunkDims(dim);
				unsigned long size=sizeof(T);
				const unsigned long targetChunkSize=1UL<<16; //64KB
				for(int i=dim; i>0; i--){
					if(size<targetChunkSize){
						hsize_t dimi=targetChunkSize/size;
						if(dimi>extents[i-1] || dimi==0)
							dimi=extents[i-1];
						chunkDims[i-1]=dimi;
						size*=chunkDims[i-1];
					}
					else
						chunkDims[i-1]=1;
				}
				H5Pset_chunk(plist_id, dim, chunkDims.data());
				H5Pset_deflate(plist_id, compressLevel);
			}
			hid_t dataspace_id=H5Screate_simple(dim, extents.data(), NULL);
			hid_t dataset_id=H5Dcreate(container, name.c_str(), dType, dataspace_id, H5P_DEFAULT, plist_id, H5P_DEFAULT);
			if(compressLevel)
				H5Pclose(plist_id);
			H5Sclose(dataspace_id);
			if(dataset_id<0)
				throw std::runtime_error("Failed to create dataset '"+name+"'");
			if(H5Dwrite(dataset_id, dType, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data())<0){
				H5Dclose(dataset_id);
				throw std::runtime_error("Failed to write dataset '"+name+"'");
			}
			return(dataset_id);
		}

		///\brief Reads a complete dataset, converting its contents to T.
		///\param extents filled with the size of the dataset in each dimension
		///\return the open dataset, which the caller must close
		template<typename T>
		hid_t readArray(hid_t container, const std::string& name, std::vector<T>& values,
		                std::vector<hsize_t>& extents){
			hid_t dataset_id=H5Dopen(container, name.c_str(), H5P_DEFAULT);
			if(dataset_id<0)
				throw std::runtime_error("Failed to open dataset '"+name+"'");
			hid_t dataspace_id=H5Dget_space(dataset_id);
			int dim=H5Sget_simple_extent_ndims(dataspace_id);
			if(dim<0){
				H5Sclose(dataspace_id);
				H5Dclose(dataset_id);
				throw std::runtime_error("Failed to get the shape of dataset '"+name+"'");
			}
			extents.resize(dim);
			H5Sget_simple_extent_dims(dataspace_id,extents.data(),NULL);
			H5Sclose(dataspace_id);
			hsize_t count=1;
			for(hsize_t e : extents)
				count*=e;
			values.resize(count);
			if(count && H5Dread(dataset_id, getHDFDatatype<T>().datatype, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data())<0){
				H5Dclose(dataset_id);
				throw std::runtime_error("Failed to read dataset '"+name+"'");
			}
			return(dataset_id);
		}

	} //namespace hdf_interface
} //namespace grid_hist

#endif //GRIDHIST_HDF5_SERIALIZATION_H
