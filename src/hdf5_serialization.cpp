#include "GridHist/hdf5_serialization.h"

namespace grid_hist{
	namespace hdf_interface{

		HDFDatatype::~HDFDatatype(){
			if(disposable)
				H5Tclose(datatype);
		}

		std::unordered_map<std::type_index,HDFDatatype> DatatypeRegistry;

		namespace detail{
			///Registers the atomic datatypes used for histogram contents and edges
			class basic_serialization_traits_init{
			public:
				basic_serialization_traits_init(){
					registerHDFDatatype<int64_t>(H5T_NATIVE_INT64,false);
					registerHDFDatatype<double>(H5T_NATIVE_DOUBLE,false);
				}
			} initializeBasicDataTypes;
		}

		template<>
		void addAttribute<std::string>(hid_t object, std::string name, const std::string& contents){
			hid_t strtype=H5Tcopy(H5T_C_S1);
			//zero sized string types are not permitted
			H5Tset_size(strtype, contents.empty()?1:contents.size());
			hsize_t dim=1;
			hid_t dataspace_id=H5Screate_simple(1, &dim, NULL);
			hid_t attribute_id=H5Acreate(object,name.c_str(),strtype,dataspace_id,H5P_DEFAULT,H5P_DEFAULT);
			if(attribute_id<0){
				H5Sclose(dataspace_id);
				H5Tclose(strtype);
				throw std::runtime_error("Failed to create attribute '"+name+"'");
			}
			const char empty[1]={'\0'};
			H5Awrite(attribute_id, strtype, contents.empty()?empty:contents.data());
			H5Aclose(attribute_id);
			H5Sclose(dataspace_id);
			H5Tclose(strtype);
		}

		template<>
		void readAttribute<std::string>(hid_t object, std::string name, std::string& dest){
			hid_t attribute_id=H5Aopen(object, name.c_str(), H5P_DEFAULT);
			if(attribute_id<0)
				throw std::runtime_error("Failed to open attribute '"+name+"'");
			hid_t actualType=H5Aget_type(attribute_id);
			H5T_class_t typeClass=H5Tget_class(actualType);
			if(typeClass!=H5T_STRING || H5Tis_variable_str(actualType)>0){
				H5Aclose(attribute_id);
				H5Tclose(actualType);
				throw std::runtime_error("Attribute '"+name+"' is not a fixed length string");
			}

			size_t size=H5Tget_size(actualType);
			dest.resize(size);
			if(H5Aread(attribute_id, actualType, &dest[0])<0){
				H5Aclose(attribute_id);
				H5Tclose(actualType);
				throw std::runtime_error("Failed to read attribute '"+name+"'");
			}
			//drop any null padding
			dest.resize(dest.find('\0')==std::string::npos ? size : dest.find('\0'));

			H5Aclose(attribute_id);
			H5Tclose(actualType);
		}

		bool hasAttribute(hid_t object, const std::string& name){
			htri_t exists=H5Aexists(object, name.c_str());
			if(exists<0)
				throw std::runtime_error("Failed to check for attribute '"+name+"'");
			return(exists>0);
		}

		herr_t collectGroupContents(hid_t group_id, const char* member_name, const H5L_info_t* info, void* operator_data){
			std::set<std::string>* items=static_cast<std::set<std::string>*>(operator_data);
			items->insert(member_name);
			return(0);
		}

		std::set<std::string> groupContents(hid_t group_id){
			hsize_t start=0;
			std::set<std::string> items;
			if(H5Literate(group_id,H5_INDEX_NAME,H5_ITER_NATIVE,&start,&collectGroupContents,&items)<0)
				throw std::runtime_error("Failed to list group contents");
			return(items);
		}

	} //namespace hdf_interface
} //namespace grid_hist
