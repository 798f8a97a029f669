#pragma once

#include <stddef.h>

#include <map>
#include <set>
#include <string>

namespace covmerge
{
	// Index 0 of every labels index, standing for "all tests"
	const unsigned int PLACEHOLDER_LABEL_ID = 0;

	extern const char *PLACEHOLDER_LABEL;

	typedef std::set<unsigned int> LabelIdSet_t;

	/**
	 * Bidirectional mapping between label ids and label strings.
	 *
	 * Id 0 is always the placeholder. New labels get an id one above the
	 * highest id in the index.
	 */
	class LabelsIndex
	{
	public:
		typedef std::map<unsigned int, std::string> IdMap_t;
		typedef std::map<std::string, unsigned int> LabelMap_t;

		LabelsIndex();

		/**
		 * Lookup or allocate the id of a label.
		 */
		unsigned int getOrAdd(const std::string &label);

		/**
		 * Insert a known id/label pair, used when loading an index.
		 *
		 * @return false if the id or the label is already taken by
		 * another entry
		 */
		bool insert(unsigned int id, const std::string &label);

		bool lookupId(const std::string &label, unsigned int &outId) const;

		bool lookupLabel(unsigned int id, std::string &outLabel) const;

		bool hasId(unsigned int id) const;

		// Only the placeholder present
		bool isOnlyPlaceholder() const;

		size_t size() const;

		const IdMap_t &getEntries() const;

		bool operator==(const LabelsIndex &other) const
		{
			return m_ids == other.m_ids;
		}

	private:
		IdMap_t m_ids;
		LabelMap_t m_labels;
	};
}
