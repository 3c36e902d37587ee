#include "GridHist/histogram_hdf5.h"

#include <iostream>

#include <boost/filesystem.hpp>

#include "GridHist/hdf5_serialization.h"

namespace grid_hist{
	namespace persistence{

		using histograms::axis;
		using histograms::histogram;

		std::string resolvePath(const std::string& path, const storageConfig& config){
			boost::filesystem::path p(path);
			if(p.is_relative() && !config.histogramDirectory.empty())
				p=boost::filesystem::path(config.histogramDirectory)/p;
			return(p.string());
		}

		namespace{
			std::vector<hsize_t> extentsOf(const histogram& h){
				std::vector<hsize_t> extents(h.shape().begin(),h.shape().end());
				return(extents);
			}

			std::string edgesName(unsigned int dim){
				return("edges"+std::to_string(dim));
			}

			histograms::dataType storedType(hid_t group_id, const std::string& name){
				hid_t dataset_id=H5Dopen(group_id, name.c_str(), H5P_DEFAULT);
				if(dataset_id<0)
					throw std::runtime_error("Failed to open dataset '"+name+"'");
				hid_t type_id=H5Dget_type(dataset_id);
				H5T_class_t typeClass=H5Tget_class(type_id);
				H5Tclose(type_id);
				H5Dclose(dataset_id);
				if(typeClass==H5T_INTEGER)
					return(histograms::INTEGER);
				if(typeClass==H5T_FLOAT)
					return(histograms::REAL);
				throw std::runtime_error("Dataset '"+name+"' does not hold numbers");
			}

			void checkExtents(const std::vector<hsize_t>& actual, const std::vector<axis>& axes, const std::string& name){
				if(actual.size()!=axes.size())
					throw std::runtime_error("Dimension mismatch for dataset '"+name+"' (expected "
					                         +std::to_string(axes.size())+", got "+std::to_string(actual.size())+")");
				for(size_t i=0; i<axes.size(); i++){
					if(actual[i]!=axes[i].numBins())
						throw std::runtime_error("Size mismatch for dataset '"+name+"' in dimension "+std::to_string(i)
						                         +" (expected "+std::to_string(axes[i].numBins())
						                         +", got "+std::to_string(actual[i])+")");
				}
			}

			///opens a file for writing, or returns a negative id if it exists and may not be replaced
			hid_t createFile(const std::string& path, const storageConfig& config){
				if(boost::filesystem::exists(path) && !config.overwrite){
					if(config.verbose)
						std::cout << path << " exists, not overwriting" << std::endl;
					return(-1);
				}
				boost::filesystem::path parent=boost::filesystem::path(path).parent_path();
				if(!parent.empty() && !boost::filesystem::exists(parent))
					boost::filesystem::create_directories(parent);
				hid_t file_id=H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
				if(file_id<0)
					throw std::runtime_error("Failed to create HDF5 file '"+path+"'");
				return(file_id);
			}

			hid_t openFile(const std::string& path){
				if(!boost::filesystem::exists(path))
					throw std::runtime_error("HDF5 file '"+path+"' does not exist");
				hid_t file_id=H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
				if(file_id<0)
					throw std::runtime_error("Failed to open HDF5 file '"+path+"'");
				return(file_id);
			}
		}

		void writeHistogramContents(hid_t group_id, const histogram& h, unsigned int compressLevel){
			using namespace hdf_interface;
			const std::vector<hsize_t> extents=extentsOf(h);

			hid_t dataset_id;
			if(h.getDataType()==histograms::INTEGER){
				std::vector<int64_t> counts;
				counts.reserve(h.getData().size());
				for(double value : h.getData()){
					//2^63, the first value beyond the range of int64_t
					if(!(value>=-9223372036854775808.0 && value<9223372036854775808.0))
						throw std::runtime_error("Value "+std::to_string(value)+" cannot be stored as a 64 bit integer");
					counts.push_back(static_cast<int64_t>(value));
				}
				dataset_id=writeArray(group_id,"data",counts,extents,compressLevel);
			}
			else
				dataset_id=writeArray(group_id,"data",h.getData(),extents,compressLevel);
			H5Dclose(dataset_id);

			if(h.hasUncertainty()){
				dataset_id=writeArray(group_id,"uncert",*h.getStoredUncertainty(),extents,compressLevel);
				H5Dclose(dataset_id);
			}

			for(unsigned int i=0; i<h.getDimensions(); i++){
				const axis& a=h.getAxis(i);
				std::vector<hsize_t> edgeCount(1,a.getEdges().size());
				dataset_id=writeArray(group_id,edgesName(i),a.getEdges(),edgeCount);
				try{
					if(!a.getLabel().empty())
						addAttribute(dataset_id,"label",a.getLabel());
				}catch(...){
					H5Dclose(dataset_id);
					throw;
				}
				H5Dclose(dataset_id);
			}

			if(!h.getLabel().empty())
				addAttribute(group_id,"label",h.getLabel());
			if(!h.getTitle().empty())
				addAttribute(group_id,"title",h.getTitle());
		}

		void writeHistogram(hid_t container, const std::string& name, const histogram& h, unsigned int compressLevel){
			hid_t group_id=H5Gcreate(container, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
			if(group_id<0)
				throw std::runtime_error("Failed to create group for histogram '"+name+"'");
			try{
				writeHistogramContents(group_id,h,compressLevel);
			}catch(...){
				H5Gclose(group_id);
				throw;
			}
			H5Gclose(group_id);
		}

		histogram readHistogramContents(hid_t group_id){
			using namespace hdf_interface;
			std::set<std::string> items=groupContents(group_id);
			if(!items.count("data"))
				throw std::runtime_error("Histogram group has no 'data' dataset");

			std::vector<axis> axes;
			for(unsigned int i=0; items.count(edgesName(i)); i++){
				std::vector<double> edges;
				std::vector<hsize_t> extents;
				hid_t dataset_id=readArray(group_id,edgesName(i),edges,extents);
				std::string axisLabel;
				try{
					if(extents.size()!=1)
						throw std::runtime_error("Dataset '"+edgesName(i)+"' is not one dimensional");
					if(hasAttribute(dataset_id,"label"))
						readAttribute(dataset_id,"label",axisLabel);
				}catch(...){
					H5Dclose(dataset_id);
					throw;
				}
				H5Dclose(dataset_id);
				axes.push_back(axis(std::move(edges),std::move(axisLabel)));
			}
			if(axes.empty())
				throw std::runtime_error("Histogram group has no axis edges");

			histograms::dataType type=storedType(group_id,"data");
			std::vector<double> data;
			std::vector<hsize_t> extents;
			H5Dclose(readArray(group_id,"data",data,extents));
			checkExtents(extents,axes,"data");

			boost::optional<std::vector<double>> uncert;
			if(items.count("uncert")){
				std::vector<double> values;
				H5Dclose(readArray(group_id,"uncert",values,extents));
				checkExtents(extents,axes,"uncert");
				uncert=std::move(values);
			}

			std::string label, title;
			if(hasAttribute(group_id,"label"))
				readAttribute(group_id,"label",label);
			if(hasAttribute(group_id,"title"))
				readAttribute(group_id,"title",title);

			return(histogram(std::move(axes),std::move(data),type,std::move(uncert),
			                 std::move(label),std::move(title)));
		}

		histogram readHistogram(hid_t container, const std::string& name){
			hid_t group_id=H5Gopen(container, name.c_str(), H5P_DEFAULT);
			if(group_id<0)
				throw std::runtime_error("Failed to open group for histogram '"+name+"'");
			try{
				histogram h=readHistogramContents(group_id);
				H5Gclose(group_id);
				return(h);
			}catch(...){
				H5Gclose(group_id);
				throw;
			}
		}

		bool saveHistogram(const std::string& path, const histogram& h, const storageConfig& config){
			const std::string fullPath=resolvePath(path,config);
			hid_t file_id=createFile(fullPath,config);
			if(file_id<0)
				return(false);
			if(config.verbose)
				std::cout << "Saving histogram to " << fullPath << std::endl;
			hid_t root_id=H5Gopen(file_id, "/", H5P_DEFAULT);
			try{
				writeHistogramContents(root_id,h,config.compressLevel);
			}catch(...){
				H5Gclose(root_id);
				H5Fclose(file_id);
				throw;
			}
			H5Gclose(root_id);
			H5Fclose(file_id);
			return(true);
		}

		histogram loadHistogram(const std::string& path, const storageConfig& config){
			const std::string fullPath=resolvePath(path,config);
			if(config.verbose)
				std::cout << "Loading histogram from " << fullPath << std::endl;
			hid_t file_id=openFile(fullPath);
			try{
				histogram h=readHistogram(file_id,"/");
				H5Fclose(file_id);
				return(h);
			}catch(...){
				H5Fclose(file_id);
				throw;
			}
		}

		bool saveHistograms(const std::string& path, const std::map<std::string,histogram>& collection,
		                    const storageConfig& config){
			const std::string fullPath=resolvePath(path,config);
			hid_t file_id=createFile(fullPath,config);
			if(file_id<0)
				return(false);
			try{
				for(const auto& entry : collection){
					if(config.verbose)
						std::cout << "Saving histogram '" << entry.first << "' to " << fullPath << std::endl;
					writeHistogram(file_id,entry.first,entry.second,config.compressLevel);
				}
			}catch(...){
				H5Fclose(file_id);
				throw;
			}
			H5Fclose(file_id);
			return(true);
		}

		std::map<std::string,histogram> loadHistograms(const std::string& path, const storageConfig& config){
			const std::string fullPath=resolvePath(path,config);
			hid_t file_id=openFile(fullPath);
			std::map<std::string,histogram> result;
			try{
				for(const std::string& name : hdf_interface::groupContents(file_id)){
					if(config.verbose)
						std::cout << "Loading histogram '" << name << "' from " << fullPath << std::endl;
					result.insert(std::make_pair(name,readHistogram(file_id,name)));
				}
			}catch(...){
				H5Fclose(file_id);
				throw;
			}
			H5Fclose(file_id);
			return(result);
		}

	} //namespace persistence
} //namespace grid_hist
