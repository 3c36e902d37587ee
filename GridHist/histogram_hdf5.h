///\file histogram_hdf5.h
///Storage of histograms in HDF5 files.
///
///Each histogram occupies one group, containing:
/// - a dataset 'data' holding the bin contents (64 bit integers or doubles, by data type),
/// - optionally a dataset 'uncert' holding the bin uncertainties,
/// - one dataset 'edges<i>' per axis holding its bin edges, with an optional string attribute 'label',
/// - optional string attributes 'label' and 'title'.

#ifndef GRIDHIST_HISTOGRAM_HDF5_H
#define GRIDHIST_HISTOGRAM_HDF5_H

#include <map>
#include <string>

#include "hdf5.h"

#include "GridHist/histogram.h"

namespace grid_hist{
	namespace persistence{

		///Settings controlling where and how histograms are stored
		struct storageConfig{
			///directory against which relative file paths are resolved; empty for the working directory
			std::string histogramDirectory;
			///whether existing files may be replaced
			bool overwrite;
			///gzip compression level (0-9) applied to contents and uncertainties
			unsigned int compressLevel;
			///whether to print progress messages
			bool verbose;

			storageConfig():overwrite(true),compressLevel(0),verbose(false){}
		};

		///Resolve a file path against the configured histogram directory
		std::string resolvePath(const std::string& path, const storageConfig& config);

		///\brief write a histogram into an open HDF5 location
		///\param container the location within the file where the histogram's group will be created
		///\param name the name of the group
		///\throws std::runtime_error if any part of the histogram cannot be written
		void writeHistogram(hid_t container, const std::string& name, const histograms::histogram& h,
		                    unsigned int compressLevel=0);

		///\brief write a histogram's datasets and attributes directly into an existing group
		void writeHistogramContents(hid_t group_id, const histograms::histogram& h, unsigned int compressLevel=0);

		///\brief read a histogram from an open HDF5 location
		///\param container the location within the file which holds the histogram's group
		///\param name the name of the group
		///\throws std::runtime_error if the group is missing or malformed
		histograms::histogram readHistogram(hid_t container, const std::string& name);

		///\brief read a histogram from the datasets and attributes of an open group
		histograms::histogram readHistogramContents(hid_t group_id);

		///\brief Store a single histogram as the root group of a file.
		///\return false if the file exists and the configuration does not permit overwriting it
		bool saveHistogram(const std::string& path, const histograms::histogram& h,
		                   const storageConfig& config=storageConfig());
		///Load a histogram stored by saveHistogram
		histograms::histogram loadHistogram(const std::string& path, const storageConfig& config=storageConfig());

		///\brief Store a collection of histograms in one file, one group per histogram.
		///\return false if the file exists and the configuration does not permit overwriting it
		bool saveHistograms(const std::string& path, const std::map<std::string,histograms::histogram>& collection,
		                    const storageConfig& config=storageConfig());
		///Load every histogram stored by saveHistograms
		std::map<std::string,histograms::histogram> loadHistograms(const std::string& path,
		                                                           const storageConfig& config=storageConfig());

	} //namespace persistence
} //namespace grid_hist

#endif //GRIDHIST_HISTOGRAM_HDF5_H
